#ifndef SITE_H
#define SITE_H

#include "RestrictionEnzyme.hpp"
#include "../seqio/types.hpp"
#include <ostream>

namespace digest {

/** Occurrence of a recognition motif in a scaffold. */
struct Site
{
  unsigned        idx_scaffold; // index of scaffold in genome
  seqio::TCoord   pos;          // leftmost base of recognition window (forward coordinates, 0-based)
  seqio::Strand   strand;       // REVERSE: reverse complement of motif matched
  MotifType       motif;

  Site();
  Site(unsigned idx_scaffold, seqio::TCoord pos, seqio::Strand strand, MotifType motif);
};

/** Order by position, then re1 before re2, then forward before reverse. */
bool operator<(const Site& lhs, const Site& rhs);
bool operator==(const Site& lhs, const Site& rhs);
std::ostream& operator<<(std::ostream& lhs, const Site& site);

} /* namespace digest */

#endif /* SITE_H */
