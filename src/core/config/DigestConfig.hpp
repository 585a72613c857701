#ifndef DIGESTCONFIG_H
#define DIGESTCONFIG_H

#include "../digest/RestrictionEnzyme.hpp"
#include "../seqio/types.hpp"
#include <boost/filesystem/path.hpp>
#include <string>

namespace config {

/** Raw option values as collected from command line and config file. */
struct DigestOptions
{
  std::string fasta;
  std::string name;
  std::string workdir;
  std::string re1;
  std::string re2;
  long ncopies;
  long readlen;
  long min_size;
  long max_size;
  bool paired;
  long nscaffolds;
  bool bed;
  int threads;
  int verbosity;

  /** Initializes default values. */
  DigestOptions();
};

/**
 * Validated, read-only settings of a digestion run.
 *
 * All checks happen in the constructor; a DigestConfig that exists is
 * consistent.
 */
class DigestConfig
{
public:
  /** Throws error::ConfigError for invalid options. */
  explicit DigestConfig(const DigestOptions& opts);

  /** input genome (FASTA, plain or gzip) */
  const std::string& fasta() const { return m_fasta; }
  /** run/sample name (output file prefix, read ID prefix) */
  const std::string& name() const { return m_name; }
  /** output directory */
  const boost::filesystem::path& workdir() const { return m_workdir; }
  const digest::RestrictionEnzyme& re1() const { return m_re1; }
  const digest::RestrictionEnzyme& re2() const { return m_re2; }
  /** reads per fragment */
  unsigned ncopies() const { return m_ncopies; }
  /** read length */
  unsigned readlen() const { return m_readlen; }
  seqio::TCoord minSize() const { return m_min_size; }
  seqio::TCoord maxSize() const { return m_max_size; }
  bool paired() const { return m_paired; }
  /** number of scaffolds to load (0: all) */
  std::size_t nscaffolds() const { return m_nscaffolds; }
  /** write retained fragments to BED file? */
  bool writeBed() const { return m_bed; }
  int threads() const { return m_threads; }
  int verbosity() const { return m_verbosity; }

  /** Print run settings to stderr. */
  void printSummary() const;

private:
  std::string m_fasta;
  std::string m_name;
  boost::filesystem::path m_workdir;
  digest::RestrictionEnzyme m_re1;
  digest::RestrictionEnzyme m_re2;
  unsigned m_ncopies;
  unsigned m_readlen;
  seqio::TCoord m_min_size;
  seqio::TCoord m_max_size;
  bool m_paired;
  std::size_t m_nscaffolds;
  bool m_bed;
  int m_threads;
  int m_verbosity;
};

} /* namespace config */

#endif /* DIGESTCONFIG_H */
