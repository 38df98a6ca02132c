#include "ConfigStore.hpp"
#include <sstream>

using namespace std;
namespace fs = boost::filesystem;

namespace config {

// default constructor
ConfigStore::ConfigStore()
: threads(1),
  _exit_code(EXIT_SUCCESS)
{
  _config = YAML::Node();
}

/** Parse command line arguments.
 * @return true: program can run normally, false: indication to stop
 */
bool ConfigStore::parseArgs (int ac, char* av[])
{
  // default values
  string fn_config = "";
  string fn_chrom_sizes = "";
  string fn_cytoband_ideo = "";
  string fn_output = "";
  string str_labels = "";
  vector<string> vec_bed_files;
  long scale = 100000;
  double height = 5;
  double cytoband_height = 10;
  double chromosome_bar_height = 1;
  double gap = 15;
  double in_gap = 2;
  double horizontal_gap = 50;
  double text_size = 16;
  double text_gap = 10;
  bool stacked = false;
  bool with_borders = false;
  bool include_non_regular = false;
  bool include_mito = false;
  int verb = 1;

  // program description
  stringstream ss;
  ss << endl << PROGRAM_NAME << " " << version::GIT_TAG_NAME << endl << endl;
  ss << "Usage: genomeplot [options] <bedFiles ...>" << endl << endl;
  ss << "Available options";

  namespace po = boost::program_options;

  po::options_description desc(ss.str());
  desc.add_options()
    ("version,v", "print version string")
    ("help,h", "print help message")
    ("config", po::value<string>(), "config file (YAML)")
    ("chrom-sizes,c", po::value<string>(&fn_chrom_sizes), "a file in UCSC chrom.sizes format")
    ("cytoband-ideo,i", po::value<string>(&fn_cytoband_ideo), "a file in UCSC cytoBandIdeo format")
    ("labels,l", po::value<string>(&str_labels), "labels of the datasets, separated by comma(,)")
    ("stacked,t", po::bool_switch(&stacked), "stack chromosomes in two columns (numbered chromosomes are stacked complementarily, others separately)")
    ("scale,s", po::value<long>(&scale)->default_value(scale), "horizontal scale (bp per point); smallest distinguishable feature")
    ("with-borders,b", po::bool_switch(&with_borders), "add borders to data entries (more visible tiny features, less fidelity)")
    ("height,e", po::value<double>(&height)->default_value(height), "vertical height of every dataset track")
    ("cytoband-height,y", po::value<double>(&cytoband_height)->default_value(cytoband_height), "vertical height of cytoband ideograms")
    ("chromosome-bar-height,r", po::value<double>(&chromosome_bar_height)->default_value(chromosome_bar_height), "vertical height of the chromosome bar (without ideogram)")
    ("gap,G", po::value<double>(&gap)->default_value(gap), "vertical gap between chromosomes")
    ("in-gap,g", po::value<double>(&in_gap)->default_value(in_gap), "vertical gap between datasets within a chromosome")
    ("horizontal-gap,z", po::value<double>(&horizontal_gap)->default_value(horizontal_gap), "minimal horizontal gap between stacked chromosomes")
    ("text-size,x", po::value<double>(&text_size)->default_value(text_size), "size of the label text (px)")
    ("text-gap,p", po::value<double>(&text_gap)->default_value(text_gap), "minimal horizontal gap between text and figure")
    ("include-non-regular,N", po::bool_switch(&include_non_regular), "include non-regular chromosomes (\"chrUn\", alternatives, etc.)")
    ("include-mito,M", po::bool_switch(&include_mito), "include the mitochondrial chromosome \"chrM\"")
    ("output,o", po::value<string>(&fn_output), "output file (default: stdout)")
    ("threads,T", po::value<int>(&threads)->default_value(1), "number of parallel threads for reading datasets")
    ("verbosity,V", po::value<int>(&verb)->default_value(verb), "detail level of console output")
  ;

  po::options_description hidden("Hidden options");
  hidden.add_options()
    ("bed-files", po::value<vector<string>>(&vec_bed_files), "BED files")
  ;
  po::options_description all_opts;
  all_opts.add(desc).add(hidden);
  po::positional_options_description pos;
  pos.add("bed-files", -1);

  po::variables_map var_map;

  try {
    po::store(po::command_line_parser(ac, av).options(all_opts).positional(pos).run(), var_map);

    if (var_map.count("version")) {
      std::cerr << PROGRAM_NAME << " " << version::GIT_TAG_NAME << endl;
      _exit_code = EXIT_SUCCESS;
      return false;
    }

    if (var_map.count("help") || ac == 1) {
      std::cerr << desc << std::endl;
      _exit_code = (ac == 1) ? EXIT_FAILURE : EXIT_SUCCESS;
      return false;
    }

    po::notify(var_map);  // might throw an error, so call after checking for "help"
  }
  catch (std::exception &e) {
    std::cerr << std::endl << "ArgumentError: " << e.what() << std::endl;
    std::cerr << desc << std::endl;
    _exit_code = EXIT_FAILURE;
    return false;
  }

  // check: config file exists
  if (var_map.count("config")) {
    fn_config = var_map["config"].as<string>();
    if (!fileExists(fn_config)) {
      fprintf(stderr, "\nArgumentError: File '%s' does not exist.\n", fn_config.c_str());
      _exit_code = EXIT_FAILURE;
      return false;
    }
    // initialize global configuration from config file
    try {
      _config = YAML::LoadFile(fn_config);
    } catch (const YAML::Exception& e) {
      fprintf(stderr, "\nArgumentError: Could not parse config file '%s': %s\n", fn_config.c_str(), e.what());
      _exit_code = EXIT_FAILURE;
      return false;
    }
  }

  // find files relative to config file's directory (or working directory)
  if ( fn_config.length() > 0 ) {
    _path_conf = fs::absolute( fs::path( fn_config ) ).parent_path();
  } else {
    _path_conf = fs::current_path();
  }

  // overwrite/set config params
  // (making sure parameters are set)
  try {
    //-------------------------------------------------------------------------
    // input files
    //-------------------------------------------------------------------------
    mergeParam("chrom-sizes", var_map, fn_chrom_sizes);
    mergeParam("cytoband-ideo", var_map, fn_cytoband_ideo);
    if (var_map.count("bed-files") || !_config["bed-files"]) {
      _config["bed-files"] = vec_bed_files;
    }
    vec_bed_files = _config["bed-files"].as<vector<string>>();
    // labels may be given as comma-separated string or as a YAML sequence
    if (var_map.count("labels") || !_config["labels"]) {
      _config["labels"] = stringio::split(str_labels, ',');
    } else if (_config["labels"].Type() == YAML::NodeType::Scalar) {
      _config["labels"] = stringio::split(_config["labels"].as<string>(), ',');
    }
    _vec_labels.clear();
    for (auto const & lbl : _config["labels"].as<vector<string>>()) {
      _vec_labels.push_back(stringio::trim(lbl));
    }
    mergeParam("output", var_map, fn_output);

    //-------------------------------------------------------------------------
    // layout params
    //-------------------------------------------------------------------------
    mergeParam("scale", var_map, scale);
    mergeParam("height", var_map, height);
    mergeParam("cytoband-height", var_map, cytoband_height);
    mergeParam("chromosome-bar-height", var_map, chromosome_bar_height);
    mergeParam("gap", var_map, gap);
    mergeParam("in-gap", var_map, in_gap);
    mergeParam("horizontal-gap", var_map, horizontal_gap);
    mergeParam("text-size", var_map, text_size);
    mergeParam("text-gap", var_map, text_gap);
    mergeParam("stacked", var_map, stacked);
    mergeParam("with-borders", var_map, with_borders);
    mergeParam("include-non-regular", var_map, include_non_regular);
    mergeParam("include-mito", var_map, include_mito);

    //-------------------------------------------------------------------------
    // runtime params
    //-------------------------------------------------------------------------
    mergeParam("threads", var_map, threads);
    mergeParam("verbosity", var_map, verb);
  } catch (const YAML::Exception& e) {
    fprintf(stderr, "\nArgumentError: Invalid value in config file '%s': %s\n", fn_config.c_str(), e.what());
    _exit_code = EXIT_FAILURE;
    return false;
  }

  //---------------------------------------------------------------------------
  // perform sanity checks
  //---------------------------------------------------------------------------

  // both data files and chromosome structure are required
  if (vec_bed_files.size() == 0 || (fn_chrom_sizes.length() == 0 && fn_cytoband_ideo.length() == 0)) {
    fprintf(stderr, "\nArgumentError: Please specify BED data files and either chromosomal size information or cytoband ideogram information!\n");
    std::cerr << desc << std::endl;
    _exit_code = EXIT_FAILURE;
    return false;
  }
  if (scale <= 0) {
    fprintf(stderr, "\nArgumentError: Parameter 'scale' must be positive (got %ld).\n", scale);
    _exit_code = EXIT_FAILURE;
    return false;
  }
  // annotation files exist?
  if (fn_chrom_sizes.length() > 0) {
    fn_chrom_sizes = resolvePath(fn_chrom_sizes);
    if (!fileExists(fn_chrom_sizes)) {
      fprintf(stderr, "\nArgumentError: Chromosome sizes file '%s' does not exist.\n", fn_chrom_sizes.c_str());
      _exit_code = EXIT_FAILURE;
      return false;
    }
    _config["chrom-sizes"] = fn_chrom_sizes;
  }
  if (fn_cytoband_ideo.length() > 0) {
    fn_cytoband_ideo = resolvePath(fn_cytoband_ideo);
    if (!fileExists(fn_cytoband_ideo)) {
      fprintf(stderr, "\nArgumentError: Cytoband file '%s' does not exist.\n", fn_cytoband_ideo.c_str());
      _exit_code = EXIT_FAILURE;
      return false;
    }
    _config["cytoband-ideo"] = fn_cytoband_ideo;
  }
  // chrom.sizes takes precedence over cytobands
  if (fn_chrom_sizes.length() > 0 && fn_cytoband_ideo.length() > 0) {
    fprintf(stderr, "[WARN] Both chrom.sizes and cytoBandIdeo given, using '%s'.\n", fn_chrom_sizes.c_str());
  }
  // missing BED files are not fatal; they are reported when reading
  _vec_bed_files.clear();
  for (auto const & fn : vec_bed_files) {
    _vec_bed_files.push_back(resolvePath(fn));
  }
  if (_vec_labels.size() > _vec_bed_files.size()) {
    fprintf(stderr, "[WARN] More labels (%lu) than BED files (%lu), extra labels are ignored.\n",
      (unsigned long)_vec_labels.size(), (unsigned long)_vec_bed_files.size());
  }

  if (verb > 0) {
    printSummary();
  }

  return true;
}

int ConfigStore::getExitCode() const {
  return _exit_code;
}

const vector<string>& ConfigStore::getBedFiles() const {
  return _vec_bed_files;
}

const vector<string>& ConfigStore::getLabels() const {
  return _vec_labels;
}

draw::PlotParams ConfigStore::getPlotParams() {
  draw::PlotParams params;
  params.with_borders = getValue<bool>("with-borders");
  layout::LayoutParams& lp = params.layout;
  lp.scale = static_cast<seqio::TCoord>(getValue<long>("scale"));
  lp.text_size = getValue<double>("text-size");
  lp.text_gap = getValue<double>("text-gap");
  lp.horizontal_gap = getValue<double>("horizontal-gap");
  lp.track_height = getValue<double>("height");
  lp.in_gap = getValue<double>("in-gap");
  lp.cytoband_height = getValue<double>("cytoband-height");
  lp.chromosome_bar_height = getValue<double>("chromosome-bar-height");
  lp.gap = getValue<double>("gap");
  lp.two_column = getValue<bool>("stacked");
  return params;
}

string ConfigStore::resolvePath(const string& fn) const {
  fs::path p( fn );
  if ( p.is_relative() && !fileExists(fn) ) { // relative path: find from config location
    p = _path_conf / p;
  }
  return p.string();
}

void ConfigStore::printSummary() {
  fprintf(stderr, "################################################################################\n");
  fprintf(stderr, "%s %s\n", PROGRAM_NAME, version::GIT_TAG_NAME);
  fprintf(stderr, "================================================================================\n");
  fprintf(stderr, "Running with the following options:\n");
  fprintf(stderr, "================================================================================\n");
  if (getValue<string>("chrom-sizes").length() > 0) {
    fprintf(stderr, "  chrom sizes:\t\t%s\n", getValue<string>("chrom-sizes").c_str());
  } else {
    fprintf(stderr, "  cytobands:\t\t%s\n", getValue<string>("cytoband-ideo").c_str());
  }
  for (size_t i=0; i<_vec_bed_files.size(); i++) {
    string lbl = i < _vec_labels.size() ? _vec_labels[i] : _vec_bed_files[i];
    fprintf(stderr, "  dataset:\t\t%s (%s)\n", _vec_bed_files[i].c_str(), lbl.c_str());
  }
  fprintf(stderr, "--------------------------------------------------------------------------------\n");
  fprintf(stderr, "  scale:\t\t%ld bp/px\n", getValue<long>("scale"));
  fprintf(stderr, "  stacked:\t\t%s\n", getValue<bool>("stacked") ? "yes" : "no");
  fprintf(stderr, "  non-regular chrs:\t%s\n", getValue<bool>("include-non-regular") ? "yes" : "no");
  fprintf(stderr, "  chrM:\t\t\t%s\n", getValue<bool>("include-mito") ? "yes" : "no");
  fprintf(stderr, "  output:\t\t%s\n", getValue<string>("output").length() > 0 ? getValue<string>("output").c_str() : "<stdout>");
  fprintf(stderr, "  threads:\t\t%d\n", threads);
  fprintf(stderr, "################################################################################\n");
}

bool fileExists(string filename) {
  struct stat buffer;
  if (stat(filename.c_str(), &buffer)!=0) {
    return false;
  }
  return true;
}

} /* namespace config */
