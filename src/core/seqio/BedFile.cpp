#include "BedFile.hpp"
#include "../errors.hpp"
#include "../stringio.hpp"
#include <boost/filesystem/operations.hpp>
#include <algorithm>
#include <fstream>

using namespace std;
using error::IOError;
namespace fs = boost::filesystem;

namespace seqio {

BedFile::BedFile() :
  m_num_recs(0),
  m_num_feat(0)
{}

void
BedFile::addRecord(
  const string& seq_id,
  TCoord start,
  TCoord end,
  const vector<string>& features)
{
  this->m_vec_seqid.push_back(seq_id);
  this->m_vec_start.push_back(start);
  this->m_vec_end.push_back(end);
  this->m_feat_val.push_back(features);
  this->m_num_feat = max(this->m_num_feat, features.size());
  this->m_num_recs++;
}

void
BedFile::writeBed(ostream& output) const {
  for (size_t i=0; i<m_num_recs; i++) {
    output << m_vec_seqid[i] << '\t' << m_vec_start[i] << '\t' << m_vec_end[i];
    for (auto const & f : m_feat_val[i])
      output << '\t' << f;
    output << '\n';
  }
}

void
BedFile::writeBed(const fs::path& filename) const {
  fs::path fn_tmp = filename;
  fn_tmp += ".tmp";
  {
    ofstream output(fn_tmp.string());
    if (!output.is_open()) {
      throw IOError(stringio::format("Could not open BED file '%s' for writing.", fn_tmp.c_str()));
    }
    this->writeBed(output);
    output.flush();
    if (!output.good()) {
      output.close();
      boost::system::error_code ec;
      fs::remove(fn_tmp, ec);
      throw IOError(stringio::format("Error writing BED file '%s'.", fn_tmp.c_str()));
    }
  }
  boost::system::error_code ec;
  fs::rename(fn_tmp, filename, ec);
  if (ec) {
    throw IOError(stringio::format("Could not move '%s' to '%s': %s",
                                   fn_tmp.c_str(), filename.c_str(), ec.message().c_str()));
  }
}

} /* namespace seqio */
