#ifndef TEST_FIXTURES_H
#define TEST_FIXTURES_H

#include "../core/seqio/GzFile.hpp"
#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

/** Scratch directory removed when the fixture goes out of scope. */
struct TempDirFixture {
  TempDirFixture() {
    tmp_dir = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("raddigest-%%%%-%%%%-%%%%");
    boost::filesystem::create_directories(tmp_dir);
    BOOST_TEST_MESSAGE( "set up fixture in " << tmp_dir );
  }
  ~TempDirFixture() {
    boost::system::error_code ec;
    boost::filesystem::remove_all(tmp_dir, ec);
    BOOST_TEST_MESSAGE( "teardown fixture" );
  }

  /** Writes `content` to a plain file in the scratch directory. */
  boost::filesystem::path writeFile(const std::string& fn, const std::string& content) const {
    boost::filesystem::path p = tmp_dir / fn;
    std::ofstream out(p.string(), std::ios::binary);
    out << content;
    return p;
  }

  /** Writes `content` gzip-compressed. */
  boost::filesystem::path writeGzFile(const std::string& fn, const std::string& content) const {
    boost::filesystem::path p = tmp_dir / fn;
    seqio::GzOutputFile out(p.string());
    out.write(content);
    out.close();
    return p;
  }

  /** Reads a file's raw bytes. */
  static std::string slurp(const boost::filesystem::path& p) {
    std::ifstream in(p.string(), std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }

  boost::filesystem::path tmp_dir;
};

/** 50 bp scaffold with one CTGCAG and one AATTC site around a run of T. */
const std::string SEQ_SCENARIO = "AAACTGCAGTTTTTTTTTTTTTTTTTTTTTTTTTTTTTTTTGAATTCAAA";

#endif /* TEST_FIXTURES_H */
