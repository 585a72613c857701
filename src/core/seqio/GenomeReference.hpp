#ifndef GENOMEREFERENCE_H
#define GENOMEREFERENCE_H

#include "Scaffold.hpp"
#include "types.hpp"
#include <memory> // unique_ptr, shared_ptr, weak_ptr
#include <string>
#include <vector>

namespace seqio {

/** Stores the scaffolds of a reference genome in file order. */
struct GenomeReference
{
  unsigned num_records;
  TCoord length;                          /** total length of all sequences */
  std::vector<std::shared_ptr<const Scaffold>> records;

  /** default c'tor */
  GenomeReference();
  /**
   * Load reference sequences from FASTA file (plain or gzip-compressed).
   *
   * \param fn_fasta      FASTA file to read.
   * \param max_records   only load the first records of the file (0: all).
   *
   * Throws error::IOError if the file cannot be read and error::FormatError
   * if it is not valid FASTA.
   */
  explicit GenomeReference(const std::string& fn_fasta, const std::size_t max_records = 0);

  /** Adds a scaffold to this GenomeReference. */
  void addScaffold(std::shared_ptr<const Scaffold> sp_scaf);
  /** Number of masked ('N') positions in all scaffolds. */
  TCoord countMasked() const;
};

} // namespace seqio

#endif // GENOMEREFERENCE_H
