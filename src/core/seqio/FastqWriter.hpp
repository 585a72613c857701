#ifndef FASTQWRITER_H
#define FASTQWRITER_H

#include "GzFile.hpp"
#include "SeqRead.hpp"
#include <boost/filesystem/path.hpp>
#include <memory>

namespace seqio {

/**
 * Writes reads to a gzip-compressed FASTQ file.
 *
 * Records go to a temporary file next to the target path. Only commit()
 * moves the file to its final name; a writer destroyed before that removes
 * the temporary file, so a failed run leaves nothing at the final path.
 */
class FastqWriter
{
public:
  explicit FastqWriter(const boost::filesystem::path& fn_out);
  ~FastqWriter();

  /** Appends a read. Throws error::IOError. */
  void write(const SeqRead& read);
  /** Closes the file and moves it to its final name. Throws error::IOError. */
  void commit();

  unsigned long numRecords() const { return m_num_records; }
  const boost::filesystem::path& path() const { return m_path_out; }
  const boost::filesystem::path& tmpPath() const { return m_path_tmp; }

private:
  FastqWriter(const FastqWriter&) = delete;
  FastqWriter& operator=(const FastqWriter&) = delete;

  boost::filesystem::path m_path_out;
  boost::filesystem::path m_path_tmp;
  std::unique_ptr<GzOutputFile> m_file;
  unsigned long m_num_records;
  bool m_committed;
};

} /* namespace seqio */

#endif /* FASTQWRITER_H */
