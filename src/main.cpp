/**
 * Genome-wide plot of interval data along chromosome ideograms.
 *
 * Workflow:
 *  - read chrom.sizes / cytoBandIdeo to determine the chromosome structure
 *  - filter and (optionally) stack chromosomes
 *  - read BED datasets and bin them onto every chromosome
 *  - compute the layout and draw every chromosome entry as SVG
 */
#include "core/config/ConfigStore.hpp"
#include "core/draw/GenomePlot.hpp"
#include "core/draw/SvgCanvas.hpp"
#include "core/ideogram/Rasterizer.hpp"
#include "core/layout/Stacking.hpp"
#include "core/seqio.hpp"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace std;
using config::ConfigStore;
using draw::GenomePlot;
using draw::PlotParams;
using draw::SvgCanvas;
using layout::TChromosomeList;
using layout::TStackSet;
using seqio::ChromosomeSet;
using seqio::Dataset;

int main (int argc, char* argv[])
{
  // user params (defined in config file or command line)
  ConfigStore config;
  bool args_ok = config.parseArgs(argc, argv);
  if (!args_ok) { return config.getExitCode(); }

  string fn_chrom_sizes = config.getValue<string>("chrom-sizes");
  string fn_cytoband_ideo = config.getValue<string>("cytoband-ideo");
  string fn_output = config.getValue<string>("output");
  bool include_non_regular = config.getValue<bool>("include-non-regular");
  bool include_mito = config.getValue<bool>("include-mito");
  int verbosity = config.getValue<int>("verbosity");
  int num_threads = config.threads;
  PlotParams params = config.getPlotParams();

  // read chromosome structure
  ChromosomeSet chromosomes;
  try {
    if (fn_chrom_sizes.length() > 0) {
      if (verbosity > 0) fprintf(stderr, "[INFO] Reading chromosome sizes from '%s'...\n", fn_chrom_sizes.c_str());
      seqio::readChromSizes(fn_chrom_sizes, chromosomes);
    } else {
      if (verbosity > 0) fprintf(stderr, "[INFO] Reading cytobands from '%s'...\n", fn_cytoband_ideo.c_str());
      seqio::readCytobandIdeo(fn_cytoband_ideo, chromosomes);
    }
  } catch (const std::runtime_error& e) { // unreadable or malformed annotation
    cerr << "[ERROR] (main) " << e.what() << endl;
    return EXIT_FAILURE;
  }
  chromosomes.freeze();
  if (verbosity > 0) fprintf(stderr, "[INFO] Read %lu chromosomes.\n", (unsigned long)chromosomes.size());

  // filter and arrange chromosomes
  TChromosomeList chr_list = layout::filterChromosomes(chromosomes, include_non_regular, include_mito);
  TStackSet stacks;
  if (params.layout.two_column) {
    stacks = layout::getStackedChromosomes(chr_list);
  } else {
    stacks = layout::getSingleStacks(chr_list);
  }
  if (verbosity > 1) {
    fprintf(stderr, "[INFO] %lu chromosomes in %lu rows:\n", (unsigned long)chr_list.size(), (unsigned long)stacks.size());
    for (auto const & stack : stacks) {
      fprintf(stderr, "  ");
      for (auto const & sp_chr : stack)
        fprintf(stderr, " %s", sp_chr->id.c_str());
      fprintf(stderr, "\n");
    }
  }

  // read datasets and bin them
  vector<Dataset> datasets = seqio::loadDatasets(config.getBedFiles(), config.getLabels(), num_threads);
  vector<string> labels;
  for (auto const & ds : datasets) {
    unsigned long num_counted = ideogram::rasterizeDataset(chromosomes, ds, params.layout.scale);
    if (verbosity > 0) {
      fprintf(stderr, "[INFO] Dataset '%s': %lu intervals (%lu on unknown chromosomes).\n",
        ds.label.c_str(), (unsigned long)ds.intervals.size(), (unsigned long)ds.intervals.size() - num_counted);
    }
    labels.push_back(ds.label);
  }

  // draw plot
  GenomePlot plot(stacks, labels, chromosomes.hasCytobands(), params);
  if (verbosity > 0) {
    fprintf(stderr, "[INFO] Canvas size: %.1f x %.1f\n", plot.getLayout().width, plot.getLayout().height);
  }
  if (fn_output.length() > 0) {
    ofstream ofs(fn_output.c_str());
    if (!ofs.is_open()) {
      cerr << "[ERROR] (main) Could not open output file: " << fn_output << endl;
      return EXIT_FAILURE;
    }
    SvgCanvas canvas(ofs);
    plot.draw(canvas);
    ofs.close();
    if (!ofs) {
      cerr << "[ERROR] (main) Could not write output file: " << fn_output << endl;
      return EXIT_FAILURE;
    }
  } else {
    SvgCanvas canvas(cout);
    plot.draw(canvas);
    cout.flush();
    if (!cout) {
      cerr << "[ERROR] (main) Could not write SVG to standard output." << endl;
      return EXIT_FAILURE;
    }
  }

  return EXIT_SUCCESS;
}
