#include "Fragment.hpp"
#include "../seqio.hpp"

using namespace std;

namespace digest {

Fragment::Fragment(const Site& left, const Site& right, seqio::TCoord start, seqio::TCoord end)
: idx_scaffold(left.idx_scaffold),
  start(start),
  end(end),
  left(left),
  right(right)
{}

string Fragment::forwardSequence(const seqio::Scaffold& scaffold) const {
  return scaffold.seq.substr(start, end-start);
}

string Fragment::sequence(const seqio::Scaffold& scaffold) const {
  string seq = forwardSequence(scaffold);
  if (isReverse())
    return seqio::rev_comp(seq);
  return seq;
}

ostream& operator<<(ostream& lhs, const Fragment& frag) {
  lhs << "[" << frag.start << "," << frag.end << ") " << frag.left << " - " << frag.right;
  return lhs;
}

} /* namespace digest */
