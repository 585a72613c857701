#include "Scaffold.hpp"

using namespace std;

namespace seqio {

Scaffold::Scaffold(const string& id, const string& desc, const string& seq)
  : id(id), description(desc), seq(seq) {}

} // namespace seqio
