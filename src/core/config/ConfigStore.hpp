#pragma once

#include "DigestConfig.hpp"
#include "../errors.hpp"
#include "../stringio.hpp"

#include <boost/program_options.hpp>
#include <string>
#include <yaml-cpp/yaml.h>

#define PROGRAM_NAME "raddigest"
#ifndef PROGRAM_VERSION
#define PROGRAM_VERSION "0.1.0"
#endif

namespace config {

/**
 * Collects run parameters from the command line and an optional YAML
 * config file. Values given on the command line take precedence.
 */
class ConfigStore
{
public:
  ConfigStore();

  /**
   * Parse command line arguments.
   * \returns true: program can run normally, false: indication to stop (help, version)
   *
   * Throws error::ConfigError for malformed arguments or config files.
   */
  bool parseArgs(int ac, char* av[]);
  /** Load parameters from YAML file. Throws error::ConfigError. */
  void loadConfigFile(const std::string& fn_config);
  /** Build validated run settings. Throws error::ConfigError. */
  DigestConfig getDigestConfig() const;

  template<typename T>
    T getValue(const char* key) const;
  template<typename T>
    T getValue(const std::string key) const;
  /** true if parameter has been set */
  bool hasValue(const char* key) const;

private:
  YAML::Node _config;
}; /* class ConfigStore */

bool fileExists(std::string filename);

/*--------------------------------*
 * function templates definitions *
 *--------------------------------*/

template<typename T>
T ConfigStore::getValue(const char* key) const {
  const YAML::Node node = _config[key];
  if (!node) {
    throw error::ConfigError(stringio::format("Missing parameter '%s'.", key));
  }
  try {
    return node.as<T>();
  } catch (const YAML::BadConversion&) {
    throw error::ConfigError(stringio::format("Invalid value for parameter '%s': '%s'",
                                              key, YAML::Dump(node).c_str()));
  }
}

template<typename T>
T
ConfigStore::getValue(const std::string key) const {
  return getValue<T>(key.c_str());
}

} /* namespace config */
