#include "ConfigStore.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <iostream>
#include <set>
#include <sstream>
#include <sys/stat.h>

using namespace std;
using error::ConfigError;
namespace fs = boost::filesystem;

namespace config {

namespace {
/** Parameters understood in config files. */
const set<string> KNOWN_PARAMS = {
  "fasta", "name", "workdir", "re1", "re2", "ncopies", "readlen",
  "min_size", "max_size", "paired", "nscaffolds", "bed", "threads", "verbosity"
};
}

// default constructor
ConfigStore::ConfigStore()
{
  _config = YAML::Node(YAML::NodeType::Map);
}

/** Parse command line arguments.
 * @return true: program can run normally, false: indication to stop
 */
bool ConfigStore::parseArgs (int ac, char* av[])
{
  // default values
  DigestOptions opts;
  string fn_config = "";

  // program description
  stringstream ss;
  ss << endl << PROGRAM_NAME << " " << PROGRAM_VERSION << endl << endl;
  ss << "In-silico double digest of a reference genome and simulation of RAD-seq reads." << endl << endl;
  ss << "Available options";

  namespace po = boost::program_options;

  po::options_description desc(ss.str());
  desc.add_options()
    ("version,v", "print version string")
    ("help,h", "print help message")
    ("config,c", po::value<string>(&fn_config), "config file (YAML)")
    ("fasta,f", po::value<string>(&opts.fasta), "reference genome (FASTA, may be gzip-compressed)")
    ("name,n", po::value<string>(&opts.name)->default_value(opts.name), "run name (output file prefix)")
    ("workdir,o", po::value<string>(&opts.workdir)->default_value(opts.workdir), "output directory")
    ("re1", po::value<string>(&opts.re1)->default_value(opts.re1), "recognition motif of first enzyme (IUPAC)")
    ("re2", po::value<string>(&opts.re2)->default_value(opts.re2), "recognition motif of second enzyme (IUPAC)")
    ("ncopies", po::value<long>(&opts.ncopies)->default_value(opts.ncopies), "reads per fragment")
    ("readlen,l", po::value<long>(&opts.readlen)->default_value(opts.readlen), "read length")
    ("min_size", po::value<long>(&opts.min_size)->default_value(opts.min_size), "minimum fragment length")
    ("max_size", po::value<long>(&opts.max_size)->default_value(opts.max_size), "maximum fragment length")
    ("paired", po::bool_switch(&opts.paired), "simulate paired-end reads")
    ("nscaffolds", po::value<long>(&opts.nscaffolds)->default_value(opts.nscaffolds), "only digest the first N scaffolds (0: all)")
    ("bed", po::bool_switch(&opts.bed), "write retained fragments to BED file")
    ("threads,p", po::value<int>(&opts.threads)->default_value(opts.threads), "number of parallel threads")
    ("verbosity", po::value<int>(&opts.verbosity)->default_value(opts.verbosity), "detail level of console output")
  ;

  po::variables_map var_map;

  try {
    po::store(po::parse_command_line(ac, av, desc), var_map);

    if (var_map.count("version")) {
      std::cerr << PROGRAM_NAME << " " << PROGRAM_VERSION << endl;
      return false;
    }

    if (var_map.count("help") || ac == 1) {
      std::cerr << desc << std::endl;
      return false;
    }

    po::notify(var_map);  // might throw an error, so call after checking for "help"
  }
  catch (const po::error &e) {
    throw ConfigError(stringio::format("%s (see '%s --help')", e.what(), PROGRAM_NAME));
  }

  // check: config file exists
  if (fn_config.length() > 0) {
    this->loadConfigFile(fn_config);
  }

  // directory to resolve relative paths in config file against
  fs::path path_conf = fs::current_path();
  if (fn_config.length() > 0) {
    path_conf = fs::absolute(fs::path(fn_config)).parent_path();
  }

  // parameter given explicitly on command line?
  auto given = [&var_map](const char* key) {
    return var_map.count(key) > 0 && !var_map[key].defaulted();
  };

  // overwrite/set config params
  // (making sure parameters are set)

  // input genome
  if (given("fasta") || !_config["fasta"]) {
    _config["fasta"] = opts.fasta;
  } else {
    fs::path p_fasta(getValue<string>("fasta"));
    if (p_fasta.is_relative() && !p_fasta.empty())
      _config["fasta"] = (path_conf / p_fasta).string();
  }
  // run name
  if (given("name") || !_config["name"]) {
    _config["name"] = opts.name;
  }
  // output directory
  if (given("workdir") || !_config["workdir"]) {
    _config["workdir"] = opts.workdir;
  } else {
    fs::path p_workdir(getValue<string>("workdir"));
    if (p_workdir.is_relative() && !p_workdir.empty())
      _config["workdir"] = (path_conf / p_workdir).string();
  }

  //---------------------------------------------------------------------------
  // digestion-related params
  //---------------------------------------------------------------------------

  if (given("re1") || !_config["re1"]) {
    _config["re1"] = opts.re1;
  }
  if (given("re2") || !_config["re2"]) {
    _config["re2"] = opts.re2;
  }
  if (given("min_size") || !_config["min_size"]) {
    _config["min_size"] = opts.min_size;
  }
  if (given("max_size") || !_config["max_size"]) {
    _config["max_size"] = opts.max_size;
  }
  if (given("nscaffolds") || !_config["nscaffolds"]) {
    _config["nscaffolds"] = opts.nscaffolds;
  }
  if (given("bed") || !_config["bed"]) {
    _config["bed"] = opts.bed;
  }

  //---------------------------------------------------------------------------
  // sequencing-related params
  //---------------------------------------------------------------------------

  if (given("ncopies") || !_config["ncopies"]) {
    _config["ncopies"] = opts.ncopies;
  }
  if (given("readlen") || !_config["readlen"]) {
    _config["readlen"] = opts.readlen;
  }
  if (given("paired") || !_config["paired"]) {
    _config["paired"] = opts.paired;
  }

  //---------------------------------------------------------------------------
  // runtime params
  //---------------------------------------------------------------------------

  if (given("threads") || !_config["threads"]) {
    _config["threads"] = opts.threads;
  }
  if (given("verbosity") || !_config["verbosity"]) {
    _config["verbosity"] = opts.verbosity;
  }

  return true;
}

void ConfigStore::loadConfigFile(const string& fn_config) {
  if (!fileExists(fn_config)) {
    throw ConfigError(stringio::format("Config file '%s' does not exist.", fn_config.c_str()));
  }
  YAML::Node node;
  try {
    node = YAML::LoadFile(fn_config);
  } catch (const YAML::Exception& e) {
    throw ConfigError(stringio::format("Could not parse config file '%s': %s", fn_config.c_str(), e.what()));
  }
  if (node.IsNull()) { // empty file
    return;
  }
  if (!node.IsMap()) {
    throw ConfigError(stringio::format("Config file '%s' must contain key-value pairs.", fn_config.c_str()));
  }
  for (auto kv : node) {
    string key = kv.first.as<string>();
    if (KNOWN_PARAMS.count(key) == 0) {
      fprintf(stderr, "[WARN] ConfigStore: unknown parameter: '%s'\n", key.c_str());
      continue;
    }
    _config[key] = kv.second;
  }
}

DigestConfig ConfigStore::getDigestConfig() const {
  DigestOptions opts;
  if (hasValue("fasta"))      opts.fasta      = getValue<string>("fasta");
  if (hasValue("name"))       opts.name       = getValue<string>("name");
  if (hasValue("workdir"))    opts.workdir    = getValue<string>("workdir");
  if (hasValue("re1"))        opts.re1        = getValue<string>("re1");
  if (hasValue("re2"))        opts.re2        = getValue<string>("re2");
  if (hasValue("ncopies"))    opts.ncopies    = getValue<long>("ncopies");
  if (hasValue("readlen"))    opts.readlen    = getValue<long>("readlen");
  if (hasValue("min_size"))   opts.min_size   = getValue<long>("min_size");
  if (hasValue("max_size"))   opts.max_size   = getValue<long>("max_size");
  if (hasValue("paired"))     opts.paired     = getValue<bool>("paired");
  if (hasValue("nscaffolds")) opts.nscaffolds = getValue<long>("nscaffolds");
  if (hasValue("bed"))        opts.bed        = getValue<bool>("bed");
  if (hasValue("threads"))    opts.threads    = getValue<int>("threads");
  if (hasValue("verbosity"))  opts.verbosity  = getValue<int>("verbosity");
  return DigestConfig(opts);
}

bool ConfigStore::hasValue(const char* key) const {
  const YAML::Node node = _config[key];
  return node.IsDefined() && !node.IsNull();
}

bool fileExists(string filename) {
  struct stat buffer;
  if (stat(filename.c_str(), &buffer)!=0) {
    return false;
  }
  return true;
}

} /* namespace config */
