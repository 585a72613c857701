#include <boost/test/unit_test.hpp>

#include "fixtures.hpp"
#include "../core/digest.hpp"
#include "../core/errors.hpp"
#include "../core/readsim.hpp"
#include "../core/seqio.hpp"
#include <memory>
#include <string>
#include <vector>
using namespace std;
using namespace readsim;
using digest::Fragment;
using digest::Site;
using seqio::Scaffold;
using seqio::SeqRead;
namespace fs = boost::filesystem;

struct FixtureReadsim : public TempDirFixture {
  FixtureReadsim() :
    re1("CTGCAG", digest::RE1),
    re2("AATTC", digest::RE2),
    scaf("chr1", "", "CTGCAGAAAACCCCGGGGTTTTGAATTC"),
    frag(Site(0, 0, seqio::FORWARD, digest::RE1), Site(0, 22, seqio::REVERSE, digest::RE2), 6, 22)
  {}

  digest::RestrictionEnzyme re1;
  digest::RestrictionEnzyme re2;
  Scaffold scaf;
  Fragment frag; // AAAACCCCGGGGTTTT
};

BOOST_FIXTURE_TEST_SUITE( readsim, FixtureReadsim )

BOOST_AUTO_TEST_CASE( single_end )
{
  ReadSimulator sim("run", 8, 3, false);
  vector<SeqRead> r1, r2;
  sim.simulate(frag, scaf, 4, r1, r2);

  BOOST_REQUIRE_EQUAL( r1.size(), 3 );
  BOOST_CHECK( r2.empty() );
  for (unsigned c=0; c<3; ++c) {
    BOOST_CHECK_EQUAL( r1[c].seq, "AAAACCCC" );
    BOOST_CHECK_EQUAL( r1[c].qual, "IIIIIIII" );
    BOOST_CHECK_EQUAL( r1[c].mate, seqio::MATE_NONE );
  }
  BOOST_CHECK_EQUAL( r1[0].id, "run_chr1_4_0" );
  BOOST_CHECK_EQUAL( r1[2].id, "run_chr1_4_2" );
}

BOOST_AUTO_TEST_CASE( paired_end )
{
  ReadSimulator sim("run", 6, 2, true);
  vector<SeqRead> r1, r2;
  sim.simulate(frag, scaf, 0, r1, r2);

  BOOST_REQUIRE_EQUAL( r1.size(), 2 );
  BOOST_REQUIRE_EQUAL( r2.size(), 2 );
  BOOST_CHECK_EQUAL( r1[0].seq, "AAAACC" );
  // reverse complement of GGTTTT
  BOOST_CHECK_EQUAL( r2[0].seq, "AAAACC" );
  BOOST_CHECK_EQUAL( r1[1].id, "run_chr1_0_1/1" );
  BOOST_CHECK_EQUAL( r2[1].id, "run_chr1_0_1/2" );
  BOOST_CHECK_EQUAL( r2[1].mate, seqio::MATE_SECOND );
}

/* fragments shorter than the read length are padded */
BOOST_AUTO_TEST_CASE( padding )
{
  ReadSimulator sim("run", 20, 1, true);
  string frag_seq = frag.sequence(scaf);

  BOOST_CHECK_EQUAL( sim.firstMateSeq(frag_seq), "AAAACCCCGGGGTTTTNNNN" );
  BOOST_CHECK_EQUAL( sim.secondMateSeq(frag_seq), "AAAACCCCGGGGTTTTNNNN" );
  BOOST_CHECK_EQUAL( sim.firstMateSeq(frag_seq).size(), sim.readLength() );
  BOOST_CHECK_EQUAL( sim.firstMateSeq("ACG"), "ACGNNNNNNNNNNNNNNNNN" );
  BOOST_CHECK_EQUAL( sim.secondMateSeq("ACG"), "CGTNNNNNNNNNNNNNNNNN" );
}

/* re2-led fragments are sequenced from the re1 end */
BOOST_AUTO_TEST_CASE( reverse_fragment )
{
  Scaffold scaf_rev("chr2", "", "GAATTCAAAACCCCGGCTGCAG");
  Fragment frag_rev(Site(0, 1, seqio::FORWARD, digest::RE2), Site(0, 16, seqio::FORWARD, digest::RE1), 6, 16);
  ReadSimulator sim("run", 4, 1, true);
  vector<SeqRead> r1, r2;
  sim.simulate(frag_rev, scaf_rev, 0, r1, r2);

  BOOST_CHECK_EQUAL( r1[0].seq, "CCGG" );
  BOOST_CHECK_EQUAL( r2[0].seq, "AAAA" );
}

/* record counts: ncopies per retained fragment, same count in both mates */
BOOST_AUTO_TEST_CASE( write_paired )
{
  seqio::GenomeReference genome;
  genome.addScaffold(make_shared<Scaffold>("chr1", "", scaf.seq + scaf.seq));
  genome.addScaffold(make_shared<Scaffold>("chr2", "", SEQ_SCENARIO));
  digest::GenomeDigest gd = digest::digestGenome(genome, re1, re2, 10, 40);
  BOOST_TEST_MESSAGE( "retained fragments: " << gd.stats.num_fragments );
  BOOST_REQUIRE( gd.stats.num_fragments > 0 );

  ReadSimulator sim("lib", 10, 3, true);
  fs::path dir_out = tmp_dir / "out" / "nested";
  ReadFiles rf = writeReads(genome, gd, sim, dir_out, "lib");

  BOOST_REQUIRE_EQUAL( rf.paths.size(), 2 );
  BOOST_CHECK_EQUAL( rf.paths[0], dir_out / "lib_R1.fastq.gz" );
  BOOST_CHECK_EQUAL( rf.paths[1], dir_out / "lib_R2.fastq.gz" );
  BOOST_CHECK_EQUAL( rf.num_fragments, gd.stats.num_fragments );
  BOOST_CHECK_EQUAL( rf.num_records, 3 * gd.stats.num_fragments );

  vector<SeqRead> reads_r1, reads_r2;
  BOOST_CHECK_EQUAL( seqio::readFastq(reads_r1, rf.paths[0].string()), rf.num_records );
  BOOST_CHECK_EQUAL( seqio::readFastq(reads_r2, rf.paths[1].string()), rf.num_records );
  for (size_t i=0; i<reads_r1.size(); ++i) {
    string id1 = reads_r1[i].id;
    string id2 = reads_r2[i].id;
    BOOST_CHECK_EQUAL( id1.substr(0, id1.size()-2), id2.substr(0, id2.size()-2) );
    BOOST_CHECK_EQUAL( reads_r1[i].mate, seqio::MATE_FIRST );
    BOOST_CHECK_EQUAL( reads_r2[i].mate, seqio::MATE_SECOND );
  }
  BOOST_CHECK( !fs::exists(rf.paths[0].string() + ".tmp") );
}

/* output path blocked by a regular file */
BOOST_AUTO_TEST_CASE( write_error )
{
  seqio::GenomeReference genome;
  genome.addScaffold(make_shared<Scaffold>("chr1", "", SEQ_SCENARIO));
  digest::GenomeDigest gd = digest::digestGenome(genome, re1, re2, 20, 40);
  ReadSimulator sim("lib", 10, 1, false);
  fs::path blocker = writeFile("blocker", "x");

  BOOST_CHECK_THROW( writeReads(genome, gd, sim, blocker, "lib"), error::IOError );
  BOOST_CHECK_THROW( makeOutputDir(blocker), error::IOError );
}

/* R1 is withdrawn when R2 cannot be moved into place */
BOOST_AUTO_TEST_CASE( write_paired_error )
{
  seqio::GenomeReference genome;
  genome.addScaffold(make_shared<Scaffold>("chr1", "", SEQ_SCENARIO));
  digest::GenomeDigest gd = digest::digestGenome(genome, re1, re2, 20, 40);
  ReadSimulator sim("lib", 10, 1, true);
  fs::path dir_out = tmp_dir / "reads";
  fs::create_directories(dir_out / "lib_R2.fastq.gz");

  BOOST_CHECK_THROW( writeReads(genome, gd, sim, dir_out, "lib"), error::IOError );
  BOOST_CHECK( !fs::exists(dir_out / "lib_R1.fastq.gz") );
  BOOST_CHECK( !fs::exists(dir_out / "lib_R1.fastq.gz.tmp") );
  BOOST_CHECK( !fs::exists(dir_out / "lib_R2.fastq.gz.tmp") );
  BOOST_CHECK( fs::is_directory(dir_out / "lib_R2.fastq.gz") );
}

BOOST_AUTO_TEST_SUITE_END()
