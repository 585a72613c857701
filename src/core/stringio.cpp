#include "stringio.hpp"
#include <cctype>

using namespace std;

namespace stringio {

istream& safeGetline(istream& is, string& t) {
  if (getline(is, t))
    chomp(t);
  return is;
}

void chomp(string& s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r'))
    s.pop_back();
}

string stripWhitespace(const string& s) {
  string out;
  out.reserve(s.size());
  for (char c : s) {
    if (!isspace(static_cast<unsigned char>(c)))
      out += c;
  }
  return out;
}

} /* namespace stringio */
