#ifndef SEQIO_H
#define SEQIO_H

#include "seqio/Scaffold.hpp"
#include "seqio/SeqRead.hpp"
#include "seqio/types.hpp"
#include "stringio.hpp"
#include <algorithm>
#include <functional>
#include <iostream>
#include <memory> // unique_ptr, shared_ptr, weak_ptr
#include <string>
#include <vector>

/** Handles sequence files (read, write) and nucleotide encodings. */
namespace seqio {

/**
 * Bitmask of the bases a nucleotide char stands for (A=1, C=2, G=4, T=8).
 *
 * Only the four unambiguous bases are accepted (case-insensitive).
 * \returns base mask, 0 for 'N' and all other chars
 */
inline TBaseMask nuc2mask (char nuc) {
  switch (nuc) {
    case 'A': case 'a': return BASE_A;
    case 'C': case 'c': return BASE_C;
    case 'G': case 'g': return BASE_G;
    case 'T': case 't': return BASE_T;
  }
  return 0;
}

/**
 * Bitmask of the bases an IUPAC nucleotide code stands for.
 *
 * \returns base mask, 0 for chars outside the IUPAC alphabet
 */
inline TBaseMask iupac2mask (char code) {
  switch (code) {
    case 'A': case 'a': return BASE_A;
    case 'C': case 'c': return BASE_C;
    case 'G': case 'g': return BASE_G;
    case 'T': case 't':
    case 'U': case 'u': return BASE_T;
    case 'R': case 'r': return BASE_A | BASE_G;
    case 'Y': case 'y': return BASE_C | BASE_T;
    case 'S': case 's': return BASE_C | BASE_G;
    case 'W': case 'w': return BASE_A | BASE_T;
    case 'K': case 'k': return BASE_G | BASE_T;
    case 'M': case 'm': return BASE_A | BASE_C;
    case 'B': case 'b': return BASE_C | BASE_G | BASE_T;
    case 'D': case 'd': return BASE_A | BASE_G | BASE_T;
    case 'H': case 'h': return BASE_A | BASE_C | BASE_T;
    case 'V': case 'v': return BASE_A | BASE_C | BASE_G;
    case 'N': case 'n': return BASE_ANY;
  }
  return 0;
}

/**
 * Get reverse complement of a nucleotide (IUPAC codes included).
 *
 * \returns complementary code in upper case, 'N' for unknown chars
 */
inline char rev_comp (char nuc) {
  switch (nuc) {
    case 'A': case 'a': return 'T';
    case 'C': case 'c': return 'G';
    case 'G': case 'g': return 'C';
    case 'T': case 't':
    case 'U': case 'u': return 'A';
    case 'R': case 'r': return 'Y';
    case 'Y': case 'y': return 'R';
    case 'S': case 's': return 'S';
    case 'W': case 'w': return 'W';
    case 'K': case 'k': return 'M';
    case 'M': case 'm': return 'K';
    case 'B': case 'b': return 'V';
    case 'V': case 'v': return 'B';
    case 'D': case 'd': return 'H';
    case 'H': case 'h': return 'D';
  }
  return 'N'; // default for unknown chars
}

/**
 * Get reverse complement of a DNA sequence.
 */
inline std::string rev_comp (std::string dna) {
  std::reverse(dna.begin(), dna.end());
  std::transform(dna.begin(), dna.end(), dna.begin(),
                 [](char c) { return rev_comp(c); });
  return dna;
}

/** Map a genome char to {A,C,G,T,N} (upper case). */
inline char normalizeNuc (char nuc) {
  switch (nuc) {
    case 'A': case 'a': return 'A';
    case 'C': case 'c': return 'C';
    case 'G': case 'g': return 'G';
    case 'T': case 't': return 'T';
  }
  return 'N';
}

/** Provides the next line of input; returns false at end of input. */
typedef std::function<bool(std::string&)> TLineSource;

/**
 * Read sequences from FASTA file (plain or gzip-compressed).
 * \param records      output parameter; list of records.
 * \param filename     filename to read records from.
 * \param max_records  stop after this many records (0: read all).
 * \returns            number of records read.
 */
std::size_t readFasta (
  std::vector<std::shared_ptr<Scaffold>>& records,
  const std::string& filename,
  const std::size_t max_records = 0
);
/**
 * Reads sequences from istream.
 * \param records      output parameter; list of records.
 * \param input        input stream to read records from.
 * \param max_records  stop after this many records (0: read all).
 * \param source_name  name used in error messages.
 * \returns            number of records read.
 */
std::size_t readFasta (
  std::vector<std::shared_ptr<Scaffold>>& records,
  std::istream& input,
  const std::size_t max_records = 0,
  const std::string& source_name = "<stream>"
);
/** Parses FASTA records from a line source (see readFasta()). */
std::size_t parseFasta (
  std::vector<std::shared_ptr<Scaffold>>& records,
  TLineSource next_line,
  const std::size_t max_records,
  const std::string& source_name
);

/** Reads FASTQ records from file (plain or gzip-compressed). */
std::size_t readFastq(std::vector<SeqRead>& reads, const std::string& filename);
/** Formats a read as a four-line FASTQ record. */
std::string toFastq(const SeqRead& read);

} /* namespace seqio */

#endif /* SEQIO_H */
