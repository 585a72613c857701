#ifndef GZFILE_H
#define GZFILE_H

#include <string>
#include <zlib.h>

namespace seqio {

/**
 * Line-oriented reader on top of zlib.
 *
 * gzopen() reads gzip-compressed and plain files alike, so callers never
 * need to know how the input was stored.
 */
class GzInputFile
{
public:
  /** Opens file for reading. Throws error::IOError if that fails. */
  explicit GzInputFile(const std::string& filename);
  ~GzInputFile();

  /**
   * Reads the next line (without line ending) into `line`.
   * \returns false at end of file.
   */
  bool getline(std::string& line);
  /** true if input data is gzip-compressed */
  bool isCompressed() const;
  const std::string& filename() const { return m_filename; }

private:
  GzInputFile(const GzInputFile&) = delete;
  GzInputFile& operator=(const GzInputFile&) = delete;

  gzFile m_file;
  std::string m_filename;
};

/** Writes gzip-compressed output. */
class GzOutputFile
{
public:
  /** Opens file for writing. Throws error::IOError if that fails. */
  explicit GzOutputFile(const std::string& filename);
  /** Closes the file if still open; errors are not reported here. */
  ~GzOutputFile();

  /** Appends data to the compressed stream. Throws error::IOError. */
  void write(const std::string& data);
  /** Flushes and closes the file. Throws error::IOError. */
  void close();
  bool isOpen() const { return m_file != nullptr; }
  const std::string& filename() const { return m_filename; }

private:
  GzOutputFile(const GzOutputFile&) = delete;
  GzOutputFile& operator=(const GzOutputFile&) = delete;

  gzFile m_file;
  std::string m_filename;
};

} /* namespace seqio */

#endif /* GZFILE_H */
