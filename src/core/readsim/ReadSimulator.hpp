#ifndef READSIMULATOR_H
#define READSIMULATOR_H

#include "../digest/Fragment.hpp"
#include "../seqio/Scaffold.hpp"
#include "../seqio/SeqRead.hpp"
#include <string>
#include <vector>

namespace readsim {

/** Filler for reads longer than their fragment. */
const char PAD_BASE = 'N';
/** Quality assigned to every simulated base (Phred 40). */
const char QUAL_CHAR = 'I';

/**
 * Turns digested fragments into fixed-length reads.
 *
 * The first mate starts at the re1 end of a fragment, the second mate is
 * read inward from the re2 end. Reads are padded with PAD_BASE up to the
 * read length when the fragment is shorter.
 */
class ReadSimulator
{
public:
  ReadSimulator(
    const std::string& name,
    unsigned read_len,
    unsigned num_copies,
    bool paired
  );

  /**
   * Generates num_copies reads for a fragment.
   *
   * \param frag       fragment to sequence.
   * \param scaffold   scaffold the fragment lies in.
   * \param idx_frag   index of fragment within its scaffold.
   * \param reads_r1   output parameter; first-mate (or single-end) reads are appended.
   * \param reads_r2   output parameter; second-mate reads are appended (paired mode only).
   */
  void simulate(
    const digest::Fragment& frag,
    const seqio::Scaffold& scaffold,
    unsigned long idx_frag,
    std::vector<seqio::SeqRead>& reads_r1,
    std::vector<seqio::SeqRead>& reads_r2
  ) const;

  /** Read identifier: <name>_<scaffold>_<fragment>_<copy>[/1|/2]. */
  std::string readId(
    const std::string& id_scaffold,
    unsigned long idx_frag,
    unsigned idx_copy,
    seqio::Mate mate
  ) const;
  /** First read_len bases of the read-order fragment sequence, padded. */
  std::string firstMateSeq(const std::string& frag_seq) const;
  /** Reverse complement of the last read_len bases, padded. */
  std::string secondMateSeq(const std::string& frag_seq) const;

  bool isPaired() const { return m_paired; }
  unsigned readLength() const { return m_read_len; }
  unsigned numCopies() const { return m_num_copies; }

private:
  std::string m_name;
  unsigned m_read_len;
  unsigned m_num_copies;
  bool m_paired;
  std::string m_qual; // quality string shared by all reads
};

} /* namespace readsim */

#endif /* READSIMULATOR_H */
