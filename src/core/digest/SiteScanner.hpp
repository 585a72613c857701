#ifndef SITESCANNER_H
#define SITESCANNER_H

#include "RestrictionEnzyme.hpp"
#include "Site.hpp"
#include "../seqio/Scaffold.hpp"
#include <vector>

namespace digest {

/**
 * Finds all occurrences of both motifs on both strands of a scaffold.
 *
 * The scan advances one base at a time, so overlapping matches are all
 * reported. Sites come out sorted (see operator<(Site, Site)); a palindromic
 * motif produces a forward and a reverse site at the same position.
 *
 * \param scaffold      sequence to scan.
 * \param idx_scaffold  index of scaffold, stored in each Site.
 * \param re1           first enzyme.
 * \param re2           second enzyme.
 * \returns             sites in ascending order.
 */
std::vector<Site> scanSites(
  const seqio::Scaffold& scaffold,
  unsigned idx_scaffold,
  const RestrictionEnzyme& re1,
  const RestrictionEnzyme& re2
);

} /* namespace digest */

#endif /* SITESCANNER_H */
