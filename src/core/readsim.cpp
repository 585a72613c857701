#include "readsim.hpp"
#include "errors.hpp"
#include "seqio/FastqWriter.hpp"
#include "stringio.hpp"
#include <boost/filesystem/operations.hpp>
#include <memory>

using namespace std;
using error::IOError;
using seqio::FastqWriter;
using seqio::SeqRead;
namespace fs = boost::filesystem;

namespace readsim {

fs::path readFileName(const fs::path& dir_out, const string& name, seqio::Mate mate) {
  const char* sfx = (mate == seqio::MATE_SECOND) ? "R2" : "R1";
  return dir_out / stringio::format("%s_%s.fastq.gz", name.c_str(), sfx);
}

void makeOutputDir(const fs::path& dir_out) {
  boost::system::error_code ec;
  if (!fs::exists(dir_out, ec)) {
    fs::create_directories(dir_out, ec);
    if (ec) {
      throw IOError(stringio::format("Could not create output directory '%s': %s",
                                     dir_out.c_str(), ec.message().c_str()));
    }
  } else if (!fs::is_directory(dir_out, ec)) {
    throw IOError(stringio::format("Output path '%s' exists but is not a directory.", dir_out.c_str()));
  }
}

ReadFiles writeReads(
  const seqio::GenomeReference& genome,
  const digest::GenomeDigest& digest,
  const ReadSimulator& simulator,
  const fs::path& dir_out,
  const string& name)
{
  makeOutputDir(dir_out);

  ReadFiles result;
  result.num_fragments = 0;
  result.num_records = 0;

  unique_ptr<FastqWriter> out_r1(new FastqWriter(readFileName(dir_out, name, seqio::MATE_FIRST)));
  unique_ptr<FastqWriter> out_r2;
  if (simulator.isPaired())
    out_r2.reset(new FastqWriter(readFileName(dir_out, name, seqio::MATE_SECOND)));

  vector<SeqRead> reads_r1;
  vector<SeqRead> reads_r2;
  for (size_t i=0; i<digest.scaffolds.size(); ++i) {
    const seqio::Scaffold& scaffold = *genome.records[i];
    const vector<digest::Fragment>& fragments = digest.scaffolds[i].fragments;
    for (size_t j=0; j<fragments.size(); ++j) {
      reads_r1.clear();
      reads_r2.clear();
      simulator.simulate(fragments[j], scaffold, j, reads_r1, reads_r2);
      for (auto const & read : reads_r1)
        out_r1->write(read);
      for (auto const & read : reads_r2)
        out_r2->write(read);
      result.num_fragments++;
    }
  }

  // move files into place only after all records have been written
  out_r1->commit();
  result.paths.push_back(out_r1->path());
  result.num_records = out_r1->numRecords();
  if (out_r2) {
    try {
      out_r2->commit();
    } catch (const IOError&) {
      // an R1 file without its mates is not valid output
      boost::system::error_code ec;
      fs::remove(out_r1->path(), ec);
      throw;
    }
    result.paths.push_back(out_r2->path());
  }

  return result;
}

} /* namespace readsim */
