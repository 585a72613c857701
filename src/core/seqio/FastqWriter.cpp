#include "FastqWriter.hpp"
#include "../errors.hpp"
#include "../seqio.hpp"
#include <boost/filesystem/operations.hpp>
#include <cstdio>

using namespace std;
using error::IOError;
namespace fs = boost::filesystem;

namespace seqio {

FastqWriter::FastqWriter(const fs::path& fn_out)
: m_path_out(fn_out),
  m_path_tmp(fn_out),
  m_num_records(0),
  m_committed(false)
{
  m_path_tmp += ".tmp";
  m_file.reset(new GzOutputFile(m_path_tmp.string()));
}

FastqWriter::~FastqWriter() {
  if (m_committed)
    return;
  m_file.reset();
  boost::system::error_code ec;
  fs::remove(m_path_tmp, ec);
  if (ec) {
    fprintf(stderr, "[WARN] (FastqWriter) Could not remove temporary file '%s': %s\n",
            m_path_tmp.c_str(), ec.message().c_str());
  }
}

void FastqWriter::write(const SeqRead& read) {
  m_file->write(toFastq(read));
  m_num_records++;
}

void FastqWriter::commit() {
  if (m_committed)
    return;
  m_file->close();
  boost::system::error_code ec;
  fs::rename(m_path_tmp, m_path_out, ec);
  if (ec) {
    throw IOError(stringio::format("Could not move '%s' to '%s': %s",
                                   m_path_tmp.c_str(), m_path_out.c_str(), ec.message().c_str()));
  }
  m_committed = true;
}

} /* namespace seqio */
