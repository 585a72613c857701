#ifndef READSIM_H
#define READSIM_H

#include "digest.hpp"
#include "readsim/ReadSimulator.hpp"
#include "seqio/GenomeReference.hpp"
#include <boost/filesystem/path.hpp>
#include <string>
#include <vector>

/** Simulation of sequencing reads from digested fragments. */
namespace readsim {

/** Output of writeReads(). */
struct ReadFiles
{
  std::vector<boost::filesystem::path> paths; // R1 (and R2 in paired mode)
  unsigned long num_fragments;                // fragments sequenced
  unsigned long num_records;                  // records per file
};

/** Output file name for a mate: <name>_R1.fastq.gz or <name>_R2.fastq.gz. */
boost::filesystem::path readFileName(
  const boost::filesystem::path& dir_out,
  const std::string& name,
  seqio::Mate mate
);

/**
 * Creates the output directory if necessary.
 * Throws error::IOError if it cannot be created or is not a directory.
 */
void makeOutputDir(const boost::filesystem::path& dir_out);

/**
 * Simulates reads for all retained fragments and writes them to FASTQ.
 *
 * Fragments are visited scaffold by scaffold in genome order, so record k
 * of the R1 file pairs with record k of the R2 file. The output directory
 * is created if necessary. Files only appear under their final names once
 * all records have been written.
 *
 * Throws error::IOError if the output directory or files cannot be written.
 */
ReadFiles writeReads(
  const seqio::GenomeReference& genome,
  const digest::GenomeDigest& digest,
  const ReadSimulator& simulator,
  const boost::filesystem::path& dir_out,
  const std::string& name
);

} /* namespace readsim */

#endif /* READSIM_H */
