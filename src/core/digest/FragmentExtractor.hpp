#ifndef FRAGMENTEXTRACTOR_H
#define FRAGMENTEXTRACTOR_H

#include "Fragment.hpp"
#include "RestrictionEnzyme.hpp"
#include "Site.hpp"
#include "../seqio/types.hpp"
#include <vector>

namespace digest {

/** Counts collected while digesting. */
struct DigestStats
{
  unsigned long num_sites_re1;
  unsigned long num_sites_re2;
  unsigned long num_candidates; // fragments between opposite sites
  unsigned long num_too_short;  // candidates below size window
  unsigned long num_too_long;   // candidates above size window
  unsigned long num_fragments;  // candidates retained

  DigestStats();
  DigestStats& operator+=(const DigestStats& rhs);
};

/**
 * Pairs sorted sites into candidate fragments.
 *
 * A single left-to-right sweep keeps the latest site as the pending left
 * boundary. A site of the same motif type replaces it, a site of the other
 * type further downstream closes a fragment and becomes the next left
 * boundary. Candidates whose recognition windows overlap (start >= end) are
 * skipped.
 *
 * \param sites  sites of a single scaffold, sorted.
 * \param re1    first enzyme (its length trims the left boundary).
 * \param re2    second enzyme.
 * \param stats  optional; receives site and candidate counts.
 */
std::vector<Fragment> findCandidateFragments(
  const std::vector<Site>& sites,
  const RestrictionEnzyme& re1,
  const RestrictionEnzyme& re2,
  DigestStats* stats = nullptr
);

/**
 * Keeps fragments with min_size <= length <= max_size.
 *
 * \param stats  optional; receives counts of retained and discarded fragments.
 */
std::vector<Fragment> filterFragments(
  const std::vector<Fragment>& candidates,
  seqio::TCoord min_size,
  seqio::TCoord max_size,
  DigestStats* stats = nullptr
);

} /* namespace digest */

#endif /* FRAGMENTEXTRACTOR_H */
