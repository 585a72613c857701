#include "GzFile.hpp"
#include "../errors.hpp"
#include "../stringio.hpp"
#include <cerrno>
#include <cstring>

using namespace std;
using error::IOError;

namespace seqio {

namespace {
// size of zlib's internal buffer and of a single gzgets() chunk
const unsigned GZ_BUFFER_SIZE = 128 * 1024;

string gzErrorMessage(gzFile file) {
  int errnum = Z_OK;
  const char* msg = gzerror(file, &errnum);
  if (errnum == Z_ERRNO)
    return strerror(errno);
  return msg;
}
}

GzInputFile::GzInputFile(const string& filename)
: m_file(nullptr),
  m_filename(filename)
{
  m_file = gzopen(filename.c_str(), "rb");
  if (m_file == nullptr) {
    throw IOError(stringio::format("Could not open file '%s' for reading: %s",
                                   filename.c_str(), strerror(errno)));
  }
  gzbuffer(m_file, GZ_BUFFER_SIZE);
}

GzInputFile::~GzInputFile() {
  if (m_file != nullptr)
    gzclose(m_file);
}

bool GzInputFile::getline(string& line) {
  line.clear();
  char buf[GZ_BUFFER_SIZE];
  for (;;) {
    if (gzgets(m_file, buf, sizeof(buf)) == Z_NULL) {
      if (!gzeof(m_file)) {
        throw IOError(stringio::format("Error reading file '%s': %s",
                                       m_filename.c_str(), gzErrorMessage(m_file).c_str()));
      }
      // last line without line ending
      return !line.empty();
    }
    line += buf;
    if (!line.empty() && line.back() == '\n') {
      stringio::chomp(line);
      return true;
    }
  }
}

bool GzInputFile::isCompressed() const {
  return gzdirect(m_file) == 0;
}

GzOutputFile::GzOutputFile(const string& filename)
: m_file(nullptr),
  m_filename(filename)
{
  m_file = gzopen(filename.c_str(), "wb");
  if (m_file == nullptr) {
    throw IOError(stringio::format("Could not open file '%s' for writing: %s",
                                   filename.c_str(), strerror(errno)));
  }
  gzbuffer(m_file, GZ_BUFFER_SIZE);
}

GzOutputFile::~GzOutputFile() {
  if (m_file != nullptr)
    gzclose(m_file);
}

void GzOutputFile::write(const string& data) {
  if (m_file == nullptr) {
    throw IOError(stringio::format("File '%s' is not open for writing", m_filename.c_str()));
  }
  if (data.empty())
    return;
  int n = gzwrite(m_file, data.c_str(), static_cast<unsigned>(data.size()));
  if (n <= 0) {
    throw IOError(stringio::format("Error writing file '%s': %s",
                                   m_filename.c_str(), gzErrorMessage(m_file).c_str()));
  }
}

void GzOutputFile::close() {
  if (m_file == nullptr)
    return;
  int res = gzclose(m_file);
  m_file = nullptr;
  if (res != Z_OK) {
    throw IOError(stringio::format("Error closing file '%s' (zlib error %d)",
                                   m_filename.c_str(), res));
  }
}

} /* namespace seqio */
