#ifndef PIPELINE_H
#define PIPELINE_H

#include "config/DigestConfig.hpp"
#include "digest.hpp"
#include <boost/filesystem/path.hpp>
#include <vector>

/** Runs load -> digest -> simulate -> write for one configuration. */
namespace pipeline {

/** What a run produced. */
struct RunSummary
{
  unsigned num_scaffolds;
  seqio::TCoord genome_length;
  digest::DigestStats stats;
  unsigned long num_reads; // records per output file
  std::vector<boost::filesystem::path> read_files;
  boost::filesystem::path bed_file; // empty if not requested
};

/**
 * Digests the configured genome and writes simulated reads.
 *
 * Throws error::FormatError, error::IOError.
 */
RunSummary run(const config::DigestConfig& cfg);

} /* namespace pipeline */

#endif /* PIPELINE_H */
