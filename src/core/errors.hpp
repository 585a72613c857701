#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

/** Exceptions raised by the digestion pipeline. */
namespace error {

/** Malformed or empty genome input. */
class FormatError : public std::runtime_error {
public:
  explicit FormatError(const std::string& msg) : std::runtime_error(msg) {}
};

/** Invalid run configuration. */
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

/** Unreadable input or unwritable output. */
class IOError : public std::runtime_error {
public:
  explicit IOError(const std::string& msg) : std::runtime_error(msg) {}
};

} /* namespace error */

#endif /* ERRORS_H */
