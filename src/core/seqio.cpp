#include "seqio.hpp"
#include "errors.hpp"
#include "seqio/GzFile.hpp"
#include <cctype>
#include <set>

using namespace std;
using error::FormatError;

namespace seqio {

/*------------------------------------*/
/*           Utility methods          */
/*------------------------------------*/

size_t readFasta (
  vector<shared_ptr<Scaffold>> &records,
  const string &filename,
  const size_t max_records
) {
  GzInputFile input(filename);
  TLineSource next_line = [&input](string& line) { return input.getline(line); };
  return parseFasta(records, next_line, max_records, filename);
}

size_t readFasta (
  vector<shared_ptr<Scaffold>> &records,
  istream &input,
  const size_t max_records,
  const string &source_name
) {
  TLineSource next_line = [&input](string& line) {
    return static_cast<bool>(stringio::safeGetline(input, line));
  };
  return parseFasta(records, next_line, max_records, source_name);
}

size_t parseFasta (
  vector<shared_ptr<Scaffold>> &records,
  TLineSource next_line,
  const size_t max_records,
  const string &source_name
) {
  string line;
  string seq_id;
  string seq_desc;
  string seq;
  bool in_record = false;
  size_t num_read = 0;

  // scaffold names have to be unique (they end up in read IDs)
  set<string> seen_ids;
  for (auto const & rec : records)
    seen_ids.insert(rec->id);

  auto add_record = [&]() {
    if (seq.empty()) {
      throw FormatError(stringio::format("Record '%s' in '%s' contains no sequence data.",
                                         seq_id.c_str(), source_name.c_str()));
    }
    records.push_back(make_shared<Scaffold>(seq_id, seq_desc, seq));
    num_read++;
  };

  while (next_line(line)) {
    if (line.length()>0 && line[0]=='>') {
      if (in_record) {
        add_record();
        if (max_records > 0 && num_read >= max_records)
          return num_read;
      }
      // parse header line
      size_t space_pos = line.find_first_of(" \t", 1);
      seq_id = line.substr(1, space_pos == string::npos ? string::npos : space_pos-1);
      seq_desc = "";
      if (space_pos != string::npos) {
        size_t desc_pos = line.find_first_not_of(" \t", space_pos);
        if (desc_pos != string::npos)
          seq_desc = line.substr(desc_pos);
      }
      if (seq_id.empty()) {
        throw FormatError(stringio::format("Empty sequence name in FASTA header of '%s'.",
                                           source_name.c_str()));
      }
      if (!seen_ids.insert(seq_id).second) {
        throw FormatError(stringio::format("Duplicate sequence name '%s' in '%s'.",
                                           seq_id.c_str(), source_name.c_str()));
      }
      seq.clear();
      in_record = true;
    }
    else {
      string chunk = stringio::stripWhitespace(line);
      if (chunk.empty()) // skip blank lines
        continue;
      if (!in_record) {
        throw FormatError(stringio::format("Sequence data before first FASTA header in '%s'.",
                                           source_name.c_str()));
      }
      for (char c : chunk)
        seq += normalizeNuc(c);
    }
  }
  if (in_record)
    add_record();

  if (num_read == 0) {
    throw FormatError(stringio::format("No FASTA records found in '%s'.", source_name.c_str()));
  }

  return num_read;
}

size_t readFastq(vector<SeqRead>& reads, const string& filename) {
  GzInputFile input(filename);
  string header, seq, sep, qual;
  size_t num_read = 0;

  while (input.getline(header)) {
    if (header.empty())
      continue;
    if (header[0] != '@') {
      throw FormatError(stringio::format("Malformed FASTQ record in '%s' (expected '@', found '%s').",
                                         filename.c_str(), header.c_str()));
    }
    if (!input.getline(seq) || !input.getline(sep) || !input.getline(qual) ||
        sep.empty() || sep[0] != '+') {
      throw FormatError(stringio::format("Truncated FASTQ record '%s' in '%s'.",
                                         header.c_str(), filename.c_str()));
    }
    SeqRead read(header.substr(1), seq, qual);
    if (read.id.size() > 2 && read.id.compare(read.id.size()-2, 2, "/1") == 0)
      read.mate = MATE_FIRST;
    else if (read.id.size() > 2 && read.id.compare(read.id.size()-2, 2, "/2") == 0)
      read.mate = MATE_SECOND;
    reads.push_back(read);
    num_read++;
  }

  return num_read;
}

string toFastq(const SeqRead& read) {
  string rec;
  rec.reserve(read.id.size() + read.seq.size() + read.qual.size() + 6);
  rec += '@';
  rec += read.id;
  rec += '\n';
  rec += read.seq;
  rec += "\n+\n";
  rec += read.qual;
  rec += '\n';
  return rec;
}

} /* namespace seqio */
