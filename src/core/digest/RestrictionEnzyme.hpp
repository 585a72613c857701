#ifndef RESTRICTIONENZYME_H
#define RESTRICTIONENZYME_H

#include "../seqio/types.hpp"
#include <string>
#include <vector>

namespace digest {

/** Which of the two enzymes of a double digest. */
enum MotifType {
  RE1, RE2
};

/** Returns "re1" or "re2". */
const char* motifLabel(MotifType type);

/**
 * Recognition motif of a restriction enzyme.
 *
 * Motifs may contain IUPAC ambiguity codes. Each motif position is
 * translated once into the set of bases it accepts, for the motif itself
 * and for its reverse complement, so scanning a genome never has to
 * re-interpret the codes.
 */
class RestrictionEnzyme
{
public:
  /**
   * Throws error::ConfigError if the motif is empty or contains characters
   * outside the IUPAC nucleotide alphabet.
   */
  RestrictionEnzyme(const std::string& motif, MotifType type);

  /** Motif in upper case (U replaced by T). */
  const std::string& motif() const { return m_motif; }
  /** Reverse complement of the motif. */
  const std::string& motifRevComp() const { return m_motif_rc; }
  MotifType type() const { return m_type; }
  std::size_t length() const { return m_motif.length(); }
  /** true if the motif equals its own reverse complement */
  bool isPalindromic() const { return m_motif == m_motif_rc; }

  /**
   * Checks whether the motif (FORWARD) or its reverse complement (REVERSE)
   * matches `seq` starting at `pos`.
   * Genome positions other than A,C,G,T never match.
   */
  bool matchesAt(const std::string& seq, seqio::TCoord pos, seqio::Strand strand) const;

private:
  std::string m_motif;
  std::string m_motif_rc;
  MotifType m_type;
  std::vector<seqio::TBaseMask> m_mask_fwd;
  std::vector<seqio::TBaseMask> m_mask_rev;
};

} /* namespace digest */

#endif /* RESTRICTIONENZYME_H */
