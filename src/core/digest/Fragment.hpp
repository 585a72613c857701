#ifndef FRAGMENT_H
#define FRAGMENT_H

#include "Site.hpp"
#include "../seqio/Scaffold.hpp"
#include "../seqio/types.hpp"
#include <ostream>
#include <string>

namespace digest {

/**
 * Stretch of a scaffold between two cut sites of opposite enzymes.
 *
 * The recognition windows themselves are excluded: start is the first base
 * after the left site's motif, end is the first base of the right site.
 */
struct Fragment
{
  unsigned      idx_scaffold; // index of scaffold in genome
  seqio::TCoord start;        // 0-based, inclusive
  seqio::TCoord end;          // 0-based, exclusive
  Site          left;         // site bounding the fragment upstream
  Site          right;        // site bounding the fragment downstream

  Fragment(const Site& left, const Site& right, seqio::TCoord start, seqio::TCoord end);

  seqio::TCoord length() const { return end - start; }
  /**
   * true if re2 bounds the fragment upstream; the fragment is then read
   * from the right end so that re1 always comes first in read order.
   */
  bool isReverse() const { return left.motif == RE2; }
  /** Fragment body as stored in the scaffold (forward strand). */
  std::string forwardSequence(const seqio::Scaffold& scaffold) const;
  /** Fragment body in read order (starting next to the re1 site). */
  std::string sequence(const seqio::Scaffold& scaffold) const;
};

std::ostream& operator<<(std::ostream& lhs, const Fragment& frag);

} /* namespace digest */

#endif /* FRAGMENT_H */
