#include "ReadSimulator.hpp"
#include "../seqio.hpp"
#include <boost/format.hpp>

using namespace std;
using seqio::Mate;
using seqio::SeqRead;

namespace readsim {

ReadSimulator::ReadSimulator(
  const string& name,
  unsigned read_len,
  unsigned num_copies,
  bool paired)
: m_name(name),
  m_read_len(read_len),
  m_num_copies(num_copies),
  m_paired(paired),
  m_qual(read_len, QUAL_CHAR)
{}

void ReadSimulator::simulate(
  const digest::Fragment& frag,
  const seqio::Scaffold& scaffold,
  unsigned long idx_frag,
  vector<SeqRead>& reads_r1,
  vector<SeqRead>& reads_r2) const
{
  string frag_seq = frag.sequence(scaffold);
  string seq_r1 = firstMateSeq(frag_seq);
  string seq_r2;
  if (m_paired)
    seq_r2 = secondMateSeq(frag_seq);

  Mate mate_r1 = m_paired ? seqio::MATE_FIRST : seqio::MATE_NONE;
  for (unsigned c=0; c<m_num_copies; ++c) {
    reads_r1.push_back(SeqRead(readId(scaffold.id, idx_frag, c, mate_r1), seq_r1, m_qual, mate_r1));
    if (m_paired)
      reads_r2.push_back(SeqRead(readId(scaffold.id, idx_frag, c, seqio::MATE_SECOND), seq_r2, m_qual, seqio::MATE_SECOND));
  }
}

string ReadSimulator::readId(
  const string& id_scaffold,
  unsigned long idx_frag,
  unsigned idx_copy,
  Mate mate) const
{
  string id = boost::str(boost::format("%s_%s_%d_%d") % m_name % id_scaffold % idx_frag % idx_copy);
  switch (mate) {
    case seqio::MATE_FIRST:  id += "/1"; break;
    case seqio::MATE_SECOND: id += "/2"; break;
    default: break;
  }
  return id;
}

string ReadSimulator::firstMateSeq(const string& frag_seq) const {
  string seq = frag_seq.substr(0, m_read_len);
  seq.resize(m_read_len, PAD_BASE);
  return seq;
}

string ReadSimulator::secondMateSeq(const string& frag_seq) const {
  size_t len = min<size_t>(m_read_len, frag_seq.length());
  string seq = seqio::rev_comp(frag_seq.substr(frag_seq.length()-len));
  seq.resize(m_read_len, PAD_BASE);
  return seq;
}

} /* namespace readsim */
