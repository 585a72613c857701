#ifndef STRINGIO_H
#define STRINGIO_H

#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

/** Small string helpers shared by the file readers and log output. */
namespace stringio {

/** printf-style formatting into a std::string. */
template<typename ... Args>
std::string format(const std::string& fmt, Args ... args);
/** Reads a line from a stream; accepts '\n' and "\r\n" line endings. */
std::istream& safeGetline(std::istream& is, std::string& t);
/** Removes trailing line ending characters ('\n', '\r') in place. */
void chomp(std::string& s);
/** Returns a copy of the string without any whitespace characters. */
std::string stripWhitespace(const std::string& s);

template<typename ... Args>
std::string format(const std::string& fmt, Args ... args)
{
  int len = std::snprintf(nullptr, 0, fmt.c_str(), args ...);
  if (len <= 0)
    return std::string();
  std::unique_ptr<char[]> buf(new char[len + 1]);
  std::snprintf(buf.get(), len + 1, fmt.c_str(), args ...);
  return std::string(buf.get(), len);
}

} /* namespace stringio */

#endif /* STRINGIO_H */
