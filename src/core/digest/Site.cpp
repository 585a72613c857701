#include "Site.hpp"
#include <tuple>

using namespace std;

namespace digest {

Site::Site()
: idx_scaffold(0), pos(0), strand(seqio::FORWARD), motif(RE1) {}

Site::Site(unsigned idx_scaffold, seqio::TCoord pos, seqio::Strand strand, MotifType motif)
: idx_scaffold(idx_scaffold), pos(pos), strand(strand), motif(motif) {}

bool operator<(const Site& lhs, const Site& rhs) {
  return tie(lhs.idx_scaffold, lhs.pos, lhs.motif, lhs.strand) <
         tie(rhs.idx_scaffold, rhs.pos, rhs.motif, rhs.strand);
}

bool operator==(const Site& lhs, const Site& rhs) {
  return tie(lhs.idx_scaffold, lhs.pos, lhs.motif, lhs.strand) ==
         tie(rhs.idx_scaffold, rhs.pos, rhs.motif, rhs.strand);
}

ostream& operator<<(ostream& lhs, const Site& site) {
  lhs << motifLabel(site.motif) << "@" << site.idx_scaffold << ":" << site.pos
      << (site.strand == seqio::FORWARD ? "(+)" : "(-)");
  return lhs;
}

} /* namespace digest */
