#include "pipeline.hpp"
#include "readsim.hpp"
#include "seqio/BedFile.hpp"
#include "seqio/GenomeReference.hpp"
#include "errors.hpp"
#include "stringio.hpp"
#include <boost/filesystem/operations.hpp>
#include <cstdio>
#include <omp.h>

using namespace std;
using digest::DigestStats;
using digest::Fragment;
using digest::GenomeDigest;
using seqio::GenomeReference;
namespace fs = boost::filesystem;

namespace pipeline {

namespace {

void printStats(const string& label, const DigestStats& s) {
  fprintf(stderr, "  %-20s re1 sites: %lu, re2 sites: %lu, candidates: %lu, "
                  "too short: %lu, too long: %lu, retained: %lu\n",
          label.c_str(), s.num_sites_re1, s.num_sites_re2, s.num_candidates,
          s.num_too_short, s.num_too_long, s.num_fragments);
}

/** Collect retained fragments as BED records (scaffold, start, end, name, length, strand). */
seqio::BedFile fragmentsToBed(const GenomeReference& genome, const GenomeDigest& gd, const string& name) {
  seqio::BedFile bed;
  for (size_t i=0; i<gd.scaffolds.size(); ++i) {
    const string& id_scaf = genome.records[i]->id;
    const vector<Fragment>& frags = gd.scaffolds[i].fragments;
    for (size_t j=0; j<frags.size(); ++j) {
      vector<string> feat = {
        stringio::format("%s_%s_%zu", name.c_str(), id_scaf.c_str(), j),
        to_string(frags[j].length()),
        frags[j].isReverse() ? "-" : "+"
      };
      bed.addRecord(id_scaf, frags[j].start, frags[j].end, feat);
    }
  }
  return bed;
}

}

RunSummary run(const config::DigestConfig& cfg) {
  RunSummary summary;
  const int verbosity = cfg.verbosity();

  // set number of parallel threads
  omp_set_num_threads(cfg.threads());

  // read reference genome
  if (verbosity > 0)
    fprintf(stderr, "[INFO] Reading reference from file '%s'...\n", cfg.fasta().c_str());
  GenomeReference genome(cfg.fasta(), cfg.nscaffolds());
  summary.num_scaffolds = genome.num_records;
  summary.genome_length = genome.length;
  if (verbosity > 0)
    fprintf(stderr, "[INFO] read %lu bp in %u sequences (%lu bp masked).\n",
            genome.length, genome.num_records, genome.countMasked());

  // digest genome
  if (verbosity > 0)
    fprintf(stderr, "[INFO] Digesting genome with %s (re1) and %s (re2)...\n",
            cfg.re1().motif().c_str(), cfg.re2().motif().c_str());
  GenomeDigest gd = digest::digestGenome(genome, cfg.re1(), cfg.re2(), cfg.minSize(), cfg.maxSize());
  summary.stats = gd.stats;
  if (verbosity > 1) {
    for (size_t i=0; i<gd.scaffolds.size(); ++i)
      printStats(genome.records[i]->id, gd.scaffolds[i].stats);
  }
  if (verbosity > 0) {
    printStats("total", gd.stats);
  }
  if (gd.stats.num_fragments == 0 && verbosity > 0) {
    fprintf(stderr, "[INFO] No fragments in size window %lu-%lu bp; output will be empty.\n",
            cfg.minSize(), cfg.maxSize());
  }

  readsim::makeOutputDir(cfg.workdir());

  // export fragment coordinates (removed again if writing the reads fails)
  if (cfg.writeBed()) {
    summary.bed_file = cfg.workdir() / stringio::format("%s.fragments.bed", cfg.name().c_str());
    fragmentsToBed(genome, gd, cfg.name()).writeBed(summary.bed_file);
    if (verbosity > 0)
      fprintf(stderr, "[INFO] wrote fragment coordinates to '%s'.\n", summary.bed_file.c_str());
  }

  // simulate reads and write them to disk
  readsim::ReadSimulator simulator(cfg.name(), cfg.readlen(), cfg.ncopies(), cfg.paired());
  readsim::ReadFiles rf;
  try {
    rf = readsim::writeReads(genome, gd, simulator, cfg.workdir(), cfg.name());
  } catch (const error::IOError&) {
    if (!summary.bed_file.empty()) {
      boost::system::error_code ec;
      fs::remove(summary.bed_file, ec);
    }
    throw;
  }
  summary.num_reads = rf.num_records;
  summary.read_files = rf.paths;
  if (verbosity > 0) {
    for (auto const & p : rf.paths)
      fprintf(stderr, "[INFO] wrote %lu reads to '%s'.\n", rf.num_records, p.c_str());
  }

  return summary;
}

} /* namespace pipeline */
