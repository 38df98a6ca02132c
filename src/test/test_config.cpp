#include <boost/test/unit_test.hpp>

#include "../core/config/ConfigStore.hpp"
#include <boost/filesystem.hpp>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>
#include "yaml-cpp/yaml.h"

using namespace std;
using config::ConfigStore;
namespace fs = boost::filesystem;

struct FixtureConfig {
  FixtureConfig() {
    BOOST_TEST_MESSAGE( "setup fixure" );
    fn_sizes = writeTmp("chr1\t1000\n", "txt");
  }
  ~FixtureConfig() {
    BOOST_TEST_MESSAGE( "teardown fixure" );
    for (auto const & fn : tmp_files) {
      boost::system::error_code ec;
      fs::remove(fn, ec);
    }
  }

  string writeTmp(const string& content, const string& ext) {
    fs::path p = fs::temp_directory_path() / fs::unique_path("genomeplot-%%%%-%%%%." + ext);
    ofstream ofs(p.string().c_str());
    ofs << content;
    ofs.close();
    tmp_files.push_back(p.string());
    return p.string();
  }

  /** Run the argument parser on a command line. */
  bool parse(const vector<string>& args) {
    m_args = args;
    m_args.insert(m_args.begin(), "genomeplot");
    vector<char*> av;
    for (auto & arg : m_args) {
      av.push_back(&arg[0]);
    }
    av.push_back(nullptr);
    return config.parseArgs(static_cast<int>(m_args.size()), av.data());
  }

  ConfigStore config;
  string fn_sizes;
  vector<string> tmp_files;
  vector<string> m_args;
};

BOOST_FIXTURE_TEST_SUITE( cli, FixtureConfig )

/* no arguments: usage and failure */
BOOST_AUTO_TEST_CASE( no_args )
{
  BOOST_CHECK( !parse(vector<string>()) );
  BOOST_CHECK( config.getExitCode() == EXIT_FAILURE );
}

/* help and version stop without error */
BOOST_AUTO_TEST_CASE( help )
{
  BOOST_CHECK( !parse(vector<string>({"--help"})) );
  BOOST_CHECK( config.getExitCode() == EXIT_SUCCESS );
}

BOOST_AUTO_TEST_CASE( print_version )
{
  BOOST_CHECK( !parse(vector<string>({"-v"})) );
  BOOST_CHECK( config.getExitCode() == EXIT_SUCCESS );
}

/* BED files and an annotation file are required */
BOOST_AUTO_TEST_CASE( required )
{
  BOOST_CHECK( !parse(vector<string>({"-V", "0", "a.bed"})) );
  BOOST_CHECK( config.getExitCode() == EXIT_FAILURE );
}

BOOST_AUTO_TEST_CASE( required_bed )
{
  BOOST_CHECK( !parse(vector<string>({"-V", "0", "-c", fn_sizes})) );
  BOOST_CHECK( config.getExitCode() == EXIT_FAILURE );
}

/* invalid values */
BOOST_AUTO_TEST_CASE( invalid )
{
  BOOST_CHECK( !parse(vector<string>({"-V", "0", "-c", fn_sizes, "--scale=0", "a.bed"})) );
  BOOST_CHECK( config.getExitCode() == EXIT_FAILURE );
}

BOOST_AUTO_TEST_CASE( missing_annotation )
{
  fs::path p = fs::temp_directory_path() / fs::unique_path("genomeplot-missing-%%%%-%%%%.txt");
  BOOST_CHECK( !parse(vector<string>({"-V", "0", "-i", p.string(), "a.bed"})) );
  BOOST_CHECK( config.getExitCode() == EXIT_FAILURE );
}

/* command line options */
BOOST_AUTO_TEST_CASE( command_line )
{
  bool ok = parse(vector<string>({
    "-V", "0", "-c", fn_sizes, "-l", "first, second", "-t", "-b",
    "-s", "1000", "--text-size", "12", "-o", "plot.svg", "a.bed", "b.bed"
  }));
  BOOST_REQUIRE( ok );

  BOOST_REQUIRE( config.getBedFiles().size() == 2 );
  BOOST_CHECK( fs::path(config.getBedFiles()[0]).filename() == "a.bed" );
  BOOST_CHECK( fs::path(config.getBedFiles()[1]).filename() == "b.bed" );
  BOOST_CHECK( config.getLabels() == vector<string>({"first", "second"}) );
  BOOST_CHECK( config.getValue<string>("chrom-sizes") == fn_sizes );
  BOOST_CHECK( config.getValue<string>("output") == "plot.svg" );
  BOOST_CHECK( !config.getValue<bool>("include-mito") );

  draw::PlotParams params = config.getPlotParams();
  BOOST_CHECK( params.layout.scale == 1000 );
  BOOST_CHECK( params.layout.two_column );
  BOOST_CHECK( params.with_borders );
  BOOST_CHECK_CLOSE( params.layout.text_size, 12.0, 1e-6 );
  // defaults
  BOOST_CHECK_CLOSE( params.layout.track_height, 5.0, 1e-6 );
  BOOST_CHECK_CLOSE( params.layout.gap, 15.0, 1e-6 );
  BOOST_CHECK_CLOSE( params.layout.horizontal_gap, 50.0, 1e-6 );
}

/* config file values, overridden by the command line */
BOOST_AUTO_TEST_CASE( config_file )
{
  string fn_bed = writeTmp("chr1\t0\t10\n", "bed");
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "chrom-sizes" << YAML::Value << fn_sizes;
  out << YAML::Key << "bed-files" << YAML::Value << YAML::BeginSeq << fn_bed << YAML::EndSeq;
  out << YAML::Key << "labels" << YAML::Value << YAML::BeginSeq << "u" << YAML::EndSeq;
  out << YAML::Key << "scale" << YAML::Value << 5000;
  out << YAML::Key << "gap" << YAML::Value << 20;
  out << YAML::Key << "stacked" << YAML::Value << true;
  out << YAML::Key << "threads" << YAML::Value << 3;
  out << YAML::EndMap;
  string fn_config = writeTmp(out.c_str(), "yml");

  BOOST_REQUIRE( parse(vector<string>({"-V", "0", "--config", fn_config, "--scale", "2000"})) );

  BOOST_REQUIRE( config.getBedFiles().size() == 1 );
  BOOST_CHECK( config.getBedFiles()[0] == fn_bed );
  BOOST_CHECK( config.getLabels() == vector<string>({"u"}) );
  BOOST_CHECK( config.threads == 3 );

  draw::PlotParams params = config.getPlotParams();
  BOOST_CHECK( params.layout.scale == 2000 );
  BOOST_CHECK( params.layout.two_column );
  BOOST_CHECK_CLOSE( params.layout.gap, 20.0, 1e-6 );
  BOOST_CHECK( !params.with_borders );
}

/* unparsable config file */
BOOST_AUTO_TEST_CASE( config_invalid )
{
  string fn_config = writeTmp("scale: [1, 2\n", "yml");
  BOOST_CHECK( !parse(vector<string>({"-V", "0", "--config", fn_config})) );
  BOOST_CHECK( config.getExitCode() == EXIT_FAILURE );
}

BOOST_AUTO_TEST_SUITE_END()
