#include "RestrictionEnzyme.hpp"
#include "../errors.hpp"
#include "../seqio.hpp"
#include <cctype>

using namespace std;
using error::ConfigError;
using seqio::TBaseMask;
using seqio::TCoord;

namespace digest {

const char* motifLabel(MotifType type) {
  return type == RE1 ? "re1" : "re2";
}

RestrictionEnzyme::RestrictionEnzyme(const string& motif, MotifType type)
: m_type(type)
{
  if (motif.empty()) {
    throw ConfigError(stringio::format("Recognition motif '%s' must not be empty.", motifLabel(type)));
  }
  for (char c : motif) {
    TBaseMask mask = seqio::iupac2mask(c);
    if (mask == 0) {
      throw ConfigError(stringio::format("Recognition motif '%s' (%s) contains invalid character '%c'.",
                                         motifLabel(type), motif.c_str(), c));
    }
    m_motif += (c == 'U' || c == 'u') ? 'T' : static_cast<char>(toupper(c));
    m_mask_fwd.push_back(mask);
  }
  m_motif_rc = seqio::rev_comp(m_motif);
  for (char c : m_motif_rc)
    m_mask_rev.push_back(seqio::iupac2mask(c));
}

bool RestrictionEnzyme::matchesAt(const string& seq, TCoord pos, seqio::Strand strand) const {
  const size_t len = m_motif.length();
  if (pos + len > seq.length())
    return false;
  const vector<TBaseMask>& mask = (strand == seqio::FORWARD) ? m_mask_fwd : m_mask_rev;
  for (size_t i=0; i<len; ++i) {
    if ((seqio::nuc2mask(seq[pos+i]) & mask[i]) == 0)
      return false;
  }
  return true;
}

} /* namespace digest */
