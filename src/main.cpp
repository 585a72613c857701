/**
 * In-silico double digest of a reference genome and simulation of
 * RAD-seq reads from the resulting fragments.
 */
#include "core/config/ConfigStore.hpp"
#include "core/config/DigestConfig.hpp"
#include "core/errors.hpp"
#include "core/pipeline.hpp"

#include <boost/timer/timer.hpp>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>

using namespace std;
using config::ConfigStore;
using config::DigestConfig;

int main (int argc, char* argv[])
{
  boost::timer::cpu_timer timer;

  try {
    // user params (defined in config file or command line)
    ConfigStore store;
    bool args_ok = store.parseArgs(argc, argv);
    if (!args_ok) { return EXIT_SUCCESS; }

    DigestConfig cfg = store.getDigestConfig();
    if (cfg.verbosity() > 0) {
      cfg.printSummary();
    }

    pipeline::RunSummary summary = pipeline::run(cfg);

    if (cfg.verbosity() > 0) {
      fprintf(stderr, "[INFO] Done. %lu fragments, %lu reads per file (%s).\n",
              summary.stats.num_fragments, summary.num_reads,
              timer.format(2, "%ws wall, %ts CPU").c_str());
    }
  }
  catch (const error::ConfigError& e) {
    fprintf(stderr, "[ERROR] Invalid configuration: %s\n", e.what());
    return EXIT_FAILURE;
  }
  catch (const error::FormatError& e) {
    fprintf(stderr, "[ERROR] Invalid input: %s\n", e.what());
    return EXIT_FAILURE;
  }
  catch (const error::IOError& e) {
    fprintf(stderr, "[ERROR] I/O failure: %s\n", e.what());
    return EXIT_FAILURE;
  }
  catch (const std::exception& e) {
    fprintf(stderr, "[ERROR] %s\n", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
