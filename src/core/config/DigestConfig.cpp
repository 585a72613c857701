#include "DigestConfig.hpp"
#include "../errors.hpp"
#include "../stringio.hpp"
#include <cctype>
#include <cstdio>
#include <limits>

using namespace std;
using digest::RestrictionEnzyme;
using error::ConfigError;

namespace config {

namespace {
/** Check that a numeric option is > 0. */
void requirePositive(const char* key, long value) {
  if (value <= 0) {
    throw ConfigError(stringio::format("Parameter '%s' must be a positive integer (found %ld).", key, value));
  }
}

/** Check that a numeric option fits into an unsigned int. */
void requireUnsigned(const char* key, long value) {
  if (static_cast<unsigned long>(value) > numeric_limits<unsigned>::max()) {
    throw ConfigError(stringio::format("Parameter '%s' is too large (found %ld, maximum %u).",
                                       key, value, numeric_limits<unsigned>::max()));
  }
}
}

DigestOptions::DigestOptions()
: fasta(""),
  name("digested"),
  workdir("digested_genomes"),
  re1("CTGCAG"),
  re2("AATTC"),
  ncopies(1),
  readlen(150),
  min_size(300),
  max_size(500),
  paired(false),
  nscaffolds(0),
  bed(false),
  threads(1),
  verbosity(1)
{}

DigestConfig::DigestConfig(const DigestOptions& opts)
: m_fasta(opts.fasta),
  m_name(opts.name),
  m_workdir(opts.workdir),
  m_re1(opts.re1, digest::RE1),
  m_re2(opts.re2, digest::RE2),
  m_ncopies(0),
  m_readlen(0),
  m_min_size(0),
  m_max_size(0),
  m_paired(opts.paired),
  m_nscaffolds(0),
  m_bed(opts.bed),
  m_threads(opts.threads),
  m_verbosity(opts.verbosity)
{
  if (m_fasta.empty()) {
    throw ConfigError("Parameter 'fasta' is required.");
  }
  if (m_name.empty()) {
    throw ConfigError("Parameter 'name' must not be empty.");
  }
  if (m_name.find('/') != string::npos) {
    throw ConfigError(stringio::format("Parameter 'name' must not contain '/' (found '%s').", m_name.c_str()));
  }
  // name is the first token of every read ID
  for (char c : m_name) {
    if (isspace(static_cast<unsigned char>(c))) {
      throw ConfigError(stringio::format("Parameter 'name' must not contain whitespace (found '%s').", m_name.c_str()));
    }
  }
  if (m_workdir.empty()) {
    throw ConfigError("Parameter 'workdir' must not be empty.");
  }
  requirePositive("ncopies", opts.ncopies);
  requirePositive("readlen", opts.readlen);
  requirePositive("min_size", opts.min_size);
  requirePositive("max_size", opts.max_size);
  requirePositive("threads", opts.threads);
  requireUnsigned("ncopies", opts.ncopies);
  requireUnsigned("readlen", opts.readlen);
  if (opts.min_size > opts.max_size) {
    throw ConfigError(stringio::format("Parameter 'min_size' (%ld) must not exceed 'max_size' (%ld).",
                                       opts.min_size, opts.max_size));
  }
  if (opts.nscaffolds < 0) {
    throw ConfigError(stringio::format("Parameter 'nscaffolds' must be >= 0 (found %ld).", opts.nscaffolds));
  }
  if (opts.verbosity < 0) {
    throw ConfigError(stringio::format("Parameter 'verbosity' must be >= 0 (found %d).", opts.verbosity));
  }
  m_ncopies = static_cast<unsigned>(opts.ncopies);
  m_readlen = static_cast<unsigned>(opts.readlen);
  m_min_size = static_cast<seqio::TCoord>(opts.min_size);
  m_max_size = static_cast<seqio::TCoord>(opts.max_size);
  m_nscaffolds = static_cast<size_t>(opts.nscaffolds);
}

void DigestConfig::printSummary() const {
  fprintf(stderr, "================================================================================\n");
  fprintf(stderr, "Running with the following options:\n");
  fprintf(stderr, "================================================================================\n");
  fprintf(stderr, "  genome:\t\t%s\n", m_fasta.c_str());
  if (m_nscaffolds > 0)
    fprintf(stderr, "  scaffolds:\t\tfirst %zu\n", m_nscaffolds);
  fprintf(stderr, "  name:\t\t\t%s\n", m_name.c_str());
  fprintf(stderr, "  output dir:\t\t%s\n", m_workdir.c_str());
  fprintf(stderr, "--------------------------------------------------------------------------------\n");
  fprintf(stderr, "Digestion:\n");
  fprintf(stderr, "--------------------------------------------------------------------------------\n");
  fprintf(stderr, "  re1:\t\t\t%s%s\n", m_re1.motif().c_str(), m_re1.isPalindromic() ? "" : " (non-palindromic)");
  fprintf(stderr, "  re2:\t\t\t%s%s\n", m_re2.motif().c_str(), m_re2.isPalindromic() ? "" : " (non-palindromic)");
  fprintf(stderr, "  fragment size:\t%lu-%lu bp\n", m_min_size, m_max_size);
  fprintf(stderr, "--------------------------------------------------------------------------------\n");
  fprintf(stderr, "Sequencing data:\n");
  fprintf(stderr, "--------------------------------------------------------------------------------\n");
  fprintf(stderr, "  mode:\t\t\t%s\n", m_paired ? "paired-end" : "single-end");
  fprintf(stderr, "  read length:\t\t%u\n", m_readlen);
  fprintf(stderr, "  copies per fragment:\t%u\n", m_ncopies);
  fprintf(stderr, "  threads:\t\t%d\n", m_threads);
  fprintf(stderr, "################################################################################\n");
}

} /* namespace config */
