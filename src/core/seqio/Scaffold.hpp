#ifndef SCAFFOLD_H
#define SCAFFOLD_H

#include <string>

namespace seqio {

/** A named reference sequence (chromosome, scaffold or contig). */
struct Scaffold
{
  std::string id;          /** identifier (first token of ID line) */
  std::string description; /** sequence description (everything after first space in ID line) */
  std::string seq;         /** sequence over {A,C,G,T,N} */

  Scaffold(const std::string& id, const std::string& desc, const std::string& seq);

  /** Sequence length in bp. */
  std::size_t length() const { return seq.length(); }
};

} // namespace seqio

#endif // SCAFFOLD_H
