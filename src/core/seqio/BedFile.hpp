#ifndef BEDFILE_H
#define BEDFILE_H

#include "types.hpp"
#include <boost/filesystem/path.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace seqio {

/**
 * Collects genomic intervals for output in BED format.
 *
 * Each record has the three required columns:
 *   1. seq_id : Identifier for a sequence (e.g. scaffold)
 *   2. start  : Start coordinate (0-based, inclusive)
 *   3. end    : End coordinate (0-based, exclusive)
 *
 * Additional columns are written in the order they were given.
 */
struct BedFile {

/** Number of records in this BED file. */
size_t m_num_recs;
/** Maximum number of additional columns (apart from seqid, start, end). */
size_t m_num_feat;
/** Sequence IDs. */
std::vector<std::string> m_vec_seqid;
/** Start coordinates (0-based, inclusive). */
std::vector<TCoord> m_vec_start;
/** End coordinates (0-based, exclusive). */
std::vector<TCoord> m_vec_end;
/** Additional columns' values (one vector per record). */
std::vector<std::vector<std::string>> m_feat_val;

/** default c'tor */
BedFile();

/** Append a record. */
void addRecord(
  const std::string& seq_id,
  TCoord start,
  TCoord end,
  const std::vector<std::string>& features = std::vector<std::string>()
);

/** Write records to output stream. */
void writeBed(std::ostream& output) const;
/**
 * Write records to file.
 * The file appears at its final path only once it has been written completely.
 * Throws error::IOError.
 */
void writeBed(const boost::filesystem::path& filename) const;

};

} /* namespace seqio */

#endif /* BEDFILE_H */
