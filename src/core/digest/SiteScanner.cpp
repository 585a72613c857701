#include "SiteScanner.hpp"

using namespace std;
using seqio::TCoord;

namespace digest {

vector<Site> scanSites(
  const seqio::Scaffold& scaffold,
  unsigned idx_scaffold,
  const RestrictionEnzyme& re1,
  const RestrictionEnzyme& re2)
{
  vector<Site> sites;
  const string& seq = scaffold.seq;
  const RestrictionEnzyme* enzymes[] = { &re1, &re2 };
  const seqio::Strand strands[] = { seqio::FORWARD, seqio::REVERSE };

  // visiting order per position yields re1 < re2, forward < reverse
  for (TCoord pos=0; pos<seq.length(); ++pos) {
    for (const RestrictionEnzyme* re : enzymes) {
      if (pos + re->length() > seq.length())
        continue;
      for (seqio::Strand strand : strands) {
        if (re->matchesAt(seq, pos, strand))
          sites.push_back(Site(idx_scaffold, pos, strand, re->type()));
      }
    }
  }

  return sites;
}

} /* namespace digest */
