#include "digest.hpp"

using namespace std;
using seqio::TCoord;

namespace digest {

ScaffoldDigest digestScaffold(
  const seqio::Scaffold& scaffold,
  unsigned idx_scaffold,
  const RestrictionEnzyme& re1,
  const RestrictionEnzyme& re2,
  TCoord min_size,
  TCoord max_size)
{
  ScaffoldDigest result;
  vector<Site> sites = scanSites(scaffold, idx_scaffold, re1, re2);
  vector<Fragment> candidates = findCandidateFragments(sites, re1, re2, &result.stats);
  result.fragments = filterFragments(candidates, min_size, max_size, &result.stats);
  return result;
}

GenomeDigest digestGenome(
  const seqio::GenomeReference& genome,
  const RestrictionEnzyme& re1,
  const RestrictionEnzyme& re2,
  TCoord min_size,
  TCoord max_size)
{
  GenomeDigest result;
  const long num_scaffolds = static_cast<long>(genome.records.size());
  result.scaffolds.resize(num_scaffolds);

  #pragma omp parallel for schedule(dynamic)
  for (long i=0; i<num_scaffolds; ++i) {
    result.scaffolds[i] = digestScaffold(*genome.records[i], i, re1, re2, min_size, max_size);
  }

  for (auto const & sd : result.scaffolds)
    result.stats += sd.stats;

  return result;
}

} /* namespace digest */
