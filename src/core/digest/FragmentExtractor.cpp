#include "FragmentExtractor.hpp"

using namespace std;
using seqio::TCoord;

namespace digest {

DigestStats::DigestStats()
: num_sites_re1(0),
  num_sites_re2(0),
  num_candidates(0),
  num_too_short(0),
  num_too_long(0),
  num_fragments(0)
{}

DigestStats& DigestStats::operator+=(const DigestStats& rhs) {
  num_sites_re1 += rhs.num_sites_re1;
  num_sites_re2 += rhs.num_sites_re2;
  num_candidates += rhs.num_candidates;
  num_too_short += rhs.num_too_short;
  num_too_long += rhs.num_too_long;
  num_fragments += rhs.num_fragments;
  return *this;
}

vector<Fragment> findCandidateFragments(
  const vector<Site>& sites,
  const RestrictionEnzyme& re1,
  const RestrictionEnzyme& re2,
  DigestStats* stats)
{
  vector<Fragment> candidates;
  if (sites.empty())
    return candidates;

  const Site* pending = &sites[0];
  for (size_t i=1; i<sites.size(); ++i) {
    const Site& site = sites[i];
    if (site.motif != pending->motif && site.pos > pending->pos) {
      TCoord len_motif = (pending->motif == RE1) ? re1.length() : re2.length();
      TCoord start = pending->pos + len_motif;
      TCoord end = site.pos;
      if (start < end)
        candidates.push_back(Fragment(*pending, site, start, end));
    }
    pending = &site;
  }

  if (stats != nullptr) {
    for (auto const & site : sites) {
      if (site.motif == RE1)
        stats->num_sites_re1++;
      else
        stats->num_sites_re2++;
    }
    stats->num_candidates += candidates.size();
  }

  return candidates;
}

vector<Fragment> filterFragments(
  const vector<Fragment>& candidates,
  TCoord min_size,
  TCoord max_size,
  DigestStats* stats)
{
  vector<Fragment> fragments;
  for (auto const & frag : candidates) {
    TCoord len = frag.length();
    if (len < min_size) {
      if (stats != nullptr) stats->num_too_short++;
    } else if (len > max_size) {
      if (stats != nullptr) stats->num_too_long++;
    } else {
      fragments.push_back(frag);
    }
  }
  if (stats != nullptr)
    stats->num_fragments += fragments.size();

  return fragments;
}

} /* namespace digest */
