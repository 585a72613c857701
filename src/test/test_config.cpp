#include <boost/test/unit_test.hpp>

#include "fixtures.hpp"
#include "../core/config/ConfigStore.hpp"
#include "../core/config/DigestConfig.hpp"
#include "../core/errors.hpp"
#include <string>
#include <vector>
using namespace std;
using namespace config;
namespace fs = boost::filesystem;

struct FixtureConfig : public TempDirFixture {
  FixtureConfig() {
    opts.fasta = "genome.fa";
  }

  /** Runs ConfigStore::parseArgs() on a list of arguments. */
  bool parse(ConfigStore& store, vector<string> args) {
    args.insert(args.begin(), "raddigest");
    vector<char*> argv;
    for (auto & a : args)
      argv.push_back(&a[0]);
    return store.parseArgs(static_cast<int>(argv.size()), argv.data());
  }

  DigestOptions opts;
};

BOOST_FIXTURE_TEST_SUITE( config, FixtureConfig )

BOOST_AUTO_TEST_CASE( defaults )
{
  DigestConfig cfg(opts);
  BOOST_CHECK_EQUAL( cfg.name(), "digested" );
  BOOST_CHECK_EQUAL( cfg.workdir(), fs::path("digested_genomes") );
  BOOST_CHECK_EQUAL( cfg.re1().motif(), "CTGCAG" );
  BOOST_CHECK_EQUAL( cfg.re2().motif(), "AATTC" );
  BOOST_CHECK_EQUAL( cfg.ncopies(), 1 );
  BOOST_CHECK_EQUAL( cfg.readlen(), 150 );
  BOOST_CHECK_EQUAL( cfg.minSize(), 300 );
  BOOST_CHECK_EQUAL( cfg.maxSize(), 500 );
  BOOST_CHECK( !cfg.paired() );
  BOOST_CHECK_EQUAL( cfg.nscaffolds(), 0 );
  BOOST_CHECK( !cfg.writeBed() );
  BOOST_CHECK_EQUAL( cfg.threads(), 1 );
}

/* invalid settings are rejected up front */
BOOST_AUTO_TEST_CASE( validation )
{
  DigestOptions o = opts;
  o.min_size = 600;
  BOOST_CHECK_THROW( DigestConfig{o}, error::ConfigError );

  o = opts; o.readlen = 0;
  BOOST_CHECK_THROW( DigestConfig{o}, error::ConfigError );
  o = opts; o.ncopies = -2;
  BOOST_CHECK_THROW( DigestConfig{o}, error::ConfigError );
  o = opts; o.min_size = 0;
  BOOST_CHECK_THROW( DigestConfig{o}, error::ConfigError );
  o = opts; o.threads = 0;
  BOOST_CHECK_THROW( DigestConfig{o}, error::ConfigError );
  o = opts; o.re1 = "";
  BOOST_CHECK_THROW( DigestConfig{o}, error::ConfigError );
  o = opts; o.re2 = "AAJTC";
  BOOST_CHECK_THROW( DigestConfig{o}, error::ConfigError );
  o = opts; o.fasta = "";
  BOOST_CHECK_THROW( DigestConfig{o}, error::ConfigError );
  o = opts; o.name = "";
  BOOST_CHECK_THROW( DigestConfig{o}, error::ConfigError );
  o = opts; o.name = "a/b";
  BOOST_CHECK_THROW( DigestConfig{o}, error::ConfigError );
  o = opts; o.name = "my sample";
  BOOST_CHECK_THROW( DigestConfig{o}, error::ConfigError );
  o = opts; o.name = "lib\t1";
  BOOST_CHECK_THROW( DigestConfig{o}, error::ConfigError );
  o = opts; o.nscaffolds = -1;
  BOOST_CHECK_THROW( DigestConfig{o}, error::ConfigError );

  // values that do not fit into an unsigned int must not wrap around
  o = opts; o.readlen = 4294967299L;
  BOOST_CHECK_THROW( DigestConfig{o}, error::ConfigError );
  o = opts; o.ncopies = 4294967296L;
  BOOST_CHECK_THROW( DigestConfig{o}, error::ConfigError );
  o = opts; o.readlen = 4294967295L;
  BOOST_CHECK_EQUAL( DigestConfig{o}.readlen(), 4294967295U );

  // equal bounds are fine
  o = opts; o.min_size = 400; o.max_size = 400;
  BOOST_CHECK_NO_THROW( DigestConfig{o} );
}

BOOST_AUTO_TEST_CASE( command_line )
{
  ConfigStore store;
  BOOST_REQUIRE( parse(store, {"-f", "genome.fa", "-n", "lib1", "--re1", "gatc",
                               "--min_size", "50", "--max_size", "80", "--paired", "-l", "75"}) );
  DigestConfig cfg = store.getDigestConfig();

  BOOST_CHECK_EQUAL( cfg.fasta(), "genome.fa" );
  BOOST_CHECK_EQUAL( cfg.name(), "lib1" );
  BOOST_CHECK_EQUAL( cfg.re1().motif(), "GATC" );
  BOOST_CHECK_EQUAL( cfg.re2().motif(), "AATTC" );
  BOOST_CHECK_EQUAL( cfg.minSize(), 50 );
  BOOST_CHECK_EQUAL( cfg.maxSize(), 80 );
  BOOST_CHECK_EQUAL( cfg.readlen(), 75 );
  BOOST_CHECK( cfg.paired() );

  ConfigStore store_help;
  BOOST_CHECK( !parse(store_help, {"--help"}) );
  ConfigStore store_bad;
  BOOST_CHECK_THROW( parse(store_bad, {"-f", "genome.fa", "--readlen", "many"}), error::ConfigError );
  ConfigStore store_unknown;
  BOOST_CHECK_THROW( parse(store_unknown, {"--no-such-option"}), error::ConfigError );
  ConfigStore store_space;
  BOOST_REQUIRE( parse(store_space, {"-f", "genome.fa", "-n", "my sample"}) );
  BOOST_CHECK_THROW( store_space.getDigestConfig(), error::ConfigError );
}

/* config file values, overridden by the command line */
BOOST_AUTO_TEST_CASE( config_file )
{
  fs::path fn_cfg = writeFile("run.yml",
    "fasta: ref/genome.fa.gz\n"
    "name: yaml_run\n"
    "workdir: out\n"
    "re2: CCGG\n"
    "ncopies: 4\n"
    "readlen: 100\n"
    "min_size: 100\n"
    "max_size: 200\n"
    "paired: true\n"
    "bed: true\n");

  ConfigStore store;
  BOOST_REQUIRE( parse(store, {"-c", fn_cfg.string(), "--readlen", "50"}) );
  DigestConfig cfg = store.getDigestConfig();

  // relative paths resolve against the config file's directory
  BOOST_CHECK_EQUAL( fs::path(cfg.fasta()), fn_cfg.parent_path() / "ref/genome.fa.gz" );
  BOOST_CHECK_EQUAL( cfg.workdir(), fn_cfg.parent_path() / "out" );
  BOOST_CHECK_EQUAL( cfg.name(), "yaml_run" );
  BOOST_CHECK_EQUAL( cfg.re1().motif(), "CTGCAG" );
  BOOST_CHECK_EQUAL( cfg.re2().motif(), "CCGG" );
  BOOST_CHECK_EQUAL( cfg.ncopies(), 4 );
  BOOST_CHECK_EQUAL( cfg.readlen(), 50 );
  BOOST_CHECK( cfg.paired() );
  BOOST_CHECK( cfg.writeBed() );
}

BOOST_AUTO_TEST_CASE( config_file_errors )
{
  ConfigStore store_missing;
  BOOST_CHECK_THROW( parse(store_missing, {"-c", (tmp_dir / "none.yml").string()}), error::ConfigError );

  fs::path fn_list = writeFile("list.yml", "- a\n- b\n");
  ConfigStore store_list;
  BOOST_CHECK_THROW( parse(store_list, {"-c", fn_list.string()}), error::ConfigError );

  fs::path fn_bad = writeFile("bad.yml", "fasta: genome.fa\nmin_size: small\n");
  ConfigStore store_bad;
  BOOST_REQUIRE( parse(store_bad, {"-c", fn_bad.string()}) );
  BOOST_CHECK_THROW( store_bad.getDigestConfig(), error::ConfigError );
}

BOOST_AUTO_TEST_SUITE_END()
