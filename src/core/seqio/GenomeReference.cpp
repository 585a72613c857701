#include "../seqio.hpp"
#include "GenomeReference.hpp"
#include <algorithm> // count()

using namespace std;

namespace seqio {

GenomeReference::GenomeReference() : num_records(0), length(0) {}

GenomeReference::GenomeReference(const string& filename, const size_t max_records)
: num_records(0),
  length(0)
{
  // read records from file
  vector<shared_ptr<Scaffold>> scaffolds;
  readFasta(scaffolds, filename, max_records);
  for (auto & sp_scaf : scaffolds)
    this->addScaffold(sp_scaf);
}

void GenomeReference::addScaffold(shared_ptr<const Scaffold> sp_scaf) {
  this->records.push_back(sp_scaf);
  this->length += sp_scaf->length();
  this->num_records = records.size();
}

TCoord GenomeReference::countMasked() const {
  TCoord n = 0;
  for (auto const & rec : records)
    n += count(rec->seq.begin(), rec->seq.end(), 'N');
  return n;
}

} // namespace seqio
