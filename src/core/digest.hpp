#ifndef DIGEST_H
#define DIGEST_H

#include "digest/Fragment.hpp"
#include "digest/FragmentExtractor.hpp"
#include "digest/RestrictionEnzyme.hpp"
#include "digest/Site.hpp"
#include "digest/SiteScanner.hpp"
#include "seqio/GenomeReference.hpp"
#include "seqio/Scaffold.hpp"
#include "seqio/types.hpp"
#include <vector>

/** In-silico restriction digest of a reference genome. */
namespace digest {

/** Retained fragments of a single scaffold. */
struct ScaffoldDigest
{
  std::vector<Fragment> fragments;
  DigestStats stats;
};

/** Retained fragments of all scaffolds, in genome order. */
struct GenomeDigest
{
  std::vector<ScaffoldDigest> scaffolds; // one entry per genome record
  DigestStats stats;                     // totals over all scaffolds
};

/**
 * Scans a scaffold for both motifs, pairs the sites into fragments and
 * keeps those inside the size window.
 */
ScaffoldDigest digestScaffold(
  const seqio::Scaffold& scaffold,
  unsigned idx_scaffold,
  const RestrictionEnzyme& re1,
  const RestrictionEnzyme& re2,
  seqio::TCoord min_size,
  seqio::TCoord max_size
);

/**
 * Digests all scaffolds of a genome.
 *
 * Scaffolds are processed in parallel (OpenMP), each result is stored at
 * its scaffold's index so the output keeps genome order.
 */
GenomeDigest digestGenome(
  const seqio::GenomeReference& genome,
  const RestrictionEnzyme& re1,
  const RestrictionEnzyme& re2,
  seqio::TCoord min_size,
  seqio::TCoord max_size
);

} /* namespace digest */

#endif /* DIGEST_H */
