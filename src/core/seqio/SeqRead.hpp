#ifndef SEQREAD_H
#define SEQREAD_H

#include <string>

namespace seqio {

/** Position of a read within a read pair. */
enum Mate {
  MATE_NONE, MATE_FIRST, MATE_SECOND
};

/** A sequencing read as written to FASTQ. */
struct SeqRead
{
  std::string id;   /** read identifier (without leading '@') */
  std::string seq;  /** base calls */
  std::string qual; /** Phred+33 quality string, same length as seq */
  Mate mate;

  SeqRead() : mate(MATE_NONE) {}
  SeqRead(const std::string& id, const std::string& seq, const std::string& qual, Mate mate = MATE_NONE)
    : id(id), seq(seq), qual(qual), mate(mate) {}
};

} // namespace seqio

#endif // SEQREAD_H
