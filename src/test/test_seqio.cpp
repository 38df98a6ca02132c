#include <boost/test/unit_test.hpp>
#include <boost/timer/timer.hpp>

#include "../core/seqio.hpp"
#include <boost/filesystem.hpp>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
using namespace std;
using namespace seqio;
namespace fs = boost::filesystem;

struct FixtureSeqio {
  FixtureSeqio() {
    BOOST_TEST_MESSAGE( "set up fixure" );
  }
  ~FixtureSeqio() {
    BOOST_TEST_MESSAGE( "teardown fixture" );
    for (auto const & fn : tmp_files) {
      boost::system::error_code ec;
      fs::remove(fn, ec);
    }
  }

  /** Write content to a temporary file and return its name. */
  string writeTmp(const string& content) {
    fs::path p = fs::temp_directory_path() / fs::unique_path("genomeplot-%%%%-%%%%.bed");
    ofstream ofs(p.string().c_str());
    ofs << content;
    ofs.close();
    tmp_files.push_back(p.string());
    return p.string();
  }

  vector<string> tmp_files;
  ChromosomeSet chromosomes;
};

BOOST_FIXTURE_TEST_SUITE( annotation, FixtureSeqio )

/* overlap is half-open and restricted to the same chromosome */
BOOST_AUTO_TEST_CASE( interval )
{
  Interval a("chr1", 100, 200);
  Interval b("chr1", 200, 300);
  Interval c("chr1", 150, 250);
  Interval d("chr2", 150, 250);

  BOOST_CHECK( a.length() == 100 );
  BOOST_CHECK( !a.overlaps(b) );
  BOOST_CHECK( a.overlaps(c) );
  BOOST_CHECK( c.overlaps(b) );
  BOOST_CHECK( !a.overlaps(d) );

  BOOST_CHECK( a < b );
  BOOST_CHECK( a < c );
  BOOST_CHECK( c < d );
  BOOST_CHECK( compare(a, a) == 0 );
  BOOST_CHECK( compare(b, a) > 0 );

  // ordering ignores the name
  BOOST_CHECK( Interval("chr1", 1, 2, "x") == Interval("chr1", 1, 2, "y") );

  a.merge(b);
  BOOST_CHECK( a.start == 100 );
  BOOST_CHECK( a.end == 300 );

  stringstream ss;
  ss << c;
  BOOST_TEST_MESSAGE( "interval: " << ss.str() );
  BOOST_CHECK( ss.str().find("chr1") != string::npos );
}

/* cytobands are kept sorted, acen bands merge into the centromere */
BOOST_AUTO_TEST_CASE( cytobands )
{
  Chromosome chr("chr1", 500);
  chr.addCytoband(Cytoband(Interval("chr1", 600, 1000, "q12"), "gneg"));
  chr.addCytoband(Cytoband(Interval("chr1", 120, 140, "q11"), "acen"));
  chr.addCytoband(Cytoband(Interval("chr1", 0, 100, "p12"), "gpos50"));
  chr.addCytoband(Cytoband(Interval("chr1", 100, 120, "p11"), "acen"));

  BOOST_CHECK( chr.hasCytobands() );
  BOOST_REQUIRE( chr.cytobands.size() == 4 );
  for (size_t i=1; i<chr.cytobands.size(); ++i) {
    BOOST_CHECK( !(chr.cytobands[i] < chr.cytobands[i-1]) );
  }
  BOOST_CHECK( chr.cytobands[0].region.name == "p12" );

  BOOST_REQUIRE( chr.centromere );
  BOOST_CHECK( chr.centromere->region.start == 100 );
  BOOST_CHECK( chr.centromere->region.end == 140 );

  // length grows to cover the last band
  BOOST_CHECK( chr.length == 1000 );
}

/* chromosome classes */
BOOST_AUTO_TEST_CASE( classes )
{
  BOOST_CHECK( Chromosome("chr1", 1).isNumbered() );
  BOOST_CHECK( Chromosome("chr22", 1).isNumbered() );
  BOOST_CHECK( !Chromosome("chrX", 1).isNumbered() );

  BOOST_CHECK( Chromosome("chrX", 1).isRegular() );
  BOOST_CHECK( !Chromosome("chrUn_gl000220", 1).isRegular() );
  BOOST_CHECK( !Chromosome("chr1_gl000191_random", 1).isRegular() );
  BOOST_CHECK( !Chromosome("chrM", 1).isRegular() );

  BOOST_CHECK( Chromosome("chrM", 1).isMitochondrial() );
  BOOST_CHECK( !Chromosome("chrMT_alt", 1).isMitochondrial() );
}

/* raster bins and interval counting */
BOOST_AUTO_TEST_CASE( bins )
{
  Chromosome chr("chr1", 1000);
  BOOST_CHECK( chr.getNumBins(100) == 11 );
  BOOST_CHECK( Chromosome("chr2", 501).getNumBins(100) == 7 );

  BOOST_CHECK( posToBin(249, 100) == 2 );
  BOOST_CHECK( posToBin(250, 100) == 3 );

  BOOST_CHECK( chr.initLabel("a", 100) );
  BOOST_CHECK( chr.data["a"].size() == 11 );
  chr.addInterval("a", Interval("chr1", 250, 350), 100);
  chr.addInterval("a", Interval("chr2", 250, 350), 100); // other chromosome
  chr.addInterval("a", Interval("chr1", 990, 5000), 100); // past the end
  BOOST_CHECK( chr.data["a"][3] == 1 );
  BOOST_CHECK( chr.data["a"][4] == 1 );
  BOOST_CHECK( chr.data["a"][10] == 1 );
  BOOST_CHECK( chr.data["a"].size() == 11 );

  // re-initialization keeps counts
  BOOST_CHECK( !chr.initLabel("a", 100) );
  BOOST_CHECK( chr.data["a"][3] == 1 );

  BOOST_CHECK_THROW( chr.addInterval("b", Interval("chr1", 0, 10), 100), std::out_of_range );
}

/* chromosome set: first occurrence wins, frozen sets reject changes */
BOOST_AUTO_TEST_CASE( chromosome_set )
{
  shared_ptr<Chromosome> sp_chr1 = chromosomes.addChromosome("chr1", 1000);
  shared_ptr<Chromosome> sp_dup = chromosomes.addChromosome("chr1", 2000);
  chromosomes.addChromosome("chr2", 500);

  BOOST_CHECK( sp_chr1 == sp_dup );
  BOOST_CHECK( chromosomes.size() == 2 );
  BOOST_CHECK( chromosomes.getChromosome("chr1")->length == 1000 );
  BOOST_CHECK( !chromosomes.getChromosome("chr3") );
  BOOST_CHECK( chromosomes.hasChromosome("chr2") );
  BOOST_CHECK( !chromosomes.hasCytobands() );
  BOOST_CHECK( chromosomes.getChromosomes()[1]->id == "chr2" );

  chromosomes.freeze();
  BOOST_CHECK( chromosomes.isFrozen() );
  BOOST_CHECK_THROW( chromosomes.addChromosome("chr3", 1), std::logic_error );
  BOOST_CHECK_THROW( chromosomes.addCytoband(Cytoband(Interval("chr1", 0, 10), "gneg")), std::logic_error );

  // coverage may still be added
  BOOST_CHECK( chromosomes.getChromosome("chr1")->initLabel("a", 100) );
}

/* read chrom.sizes */
BOOST_AUTO_TEST_CASE( chrom_sizes )
{
  stringstream ss;
  ss << "chr1\t1000\n"
     << "\n"
     << "# comment\n"
     << "chr2 500\r\n"
     << "chr1\t3000\n";
  parseChromSizes(ss, chromosomes);

  BOOST_CHECK( chromosomes.size() == 2 );
  BOOST_CHECK( chromosomes.getChromosome("chr1")->length == 1000 );
  BOOST_CHECK( chromosomes.getChromosome("chr2")->length == 500 );
  BOOST_CHECK( !chromosomes.hasCytobands() );
}

/* malformed chrom.sizes lines are reported with their line number */
BOOST_AUTO_TEST_CASE( chrom_sizes_malformed )
{
  stringstream ss_cols("chr1 1000\nchr2\n");
  BOOST_CHECK_THROW( parseChromSizes(ss_cols, chromosomes, "sizes.txt"), MalformedAnnotationLine );

  stringstream ss_neg("chr1 -5\n");
  BOOST_CHECK_THROW( parseChromSizes(ss_neg, chromosomes), MalformedAnnotationLine );

  stringstream ss_nan("chr1 1000\n\nchr2 abc\n");
  try {
    parseChromSizes(ss_nan, chromosomes, "sizes.txt");
    BOOST_ERROR( "expected MalformedAnnotationLine" );
  } catch (const MalformedAnnotationLine& e) {
    BOOST_TEST_MESSAGE( "caught: " << e.what() );
    BOOST_CHECK( e.getLineNo() == 3 );
    BOOST_CHECK( e.getFilename() == "sizes.txt" );
  }
}

/* read cytoBandIdeo */
BOOST_AUTO_TEST_CASE( cytoband_ideo )
{
  stringstream ss;
  ss << "chr1\t0\t100\tp12\tgpos50\n"
     << "chr1\t100\t120\tp11\tacen\n"
     << "chr1\t120\t140\tq11\tacen\n"
     << "chr1\t140\t1000\tq12\tgneg\n"
     << "chrUn_gl000220\t0\t161802\tgneg\n";
  parseCytobandIdeo(ss, chromosomes);

  BOOST_CHECK( chromosomes.size() == 2 );
  BOOST_CHECK( chromosomes.hasCytobands() );
  shared_ptr<Chromosome> sp_chr1 = chromosomes.getChromosome("chr1");
  BOOST_CHECK( sp_chr1->length == 1000 );
  BOOST_CHECK( sp_chr1->cytobands.size() == 4 );
  BOOST_REQUIRE( sp_chr1->centromere );
  BOOST_CHECK( sp_chr1->centromere->region.start == 100 );
  BOOST_CHECK( sp_chr1->centromere->region.end == 140 );

  // four columns: blank band name
  shared_ptr<Chromosome> sp_un = chromosomes.getChromosome("chrUn_gl000220");
  BOOST_CHECK( sp_un->length == 161802 );
  BOOST_REQUIRE( sp_un->cytobands.size() == 1 );
  BOOST_CHECK( sp_un->cytobands[0].region.name == "" );
  BOOST_CHECK( sp_un->cytobands[0].stain == "gneg" );
  BOOST_CHECK( !sp_un->centromere );
}

/* malformed cytoBandIdeo lines */
BOOST_AUTO_TEST_CASE( cytoband_ideo_malformed )
{
  stringstream ss_cols("chr1 0 100\n");
  BOOST_CHECK_THROW( parseCytobandIdeo(ss_cols, chromosomes), MalformedAnnotationLine );

  stringstream ss_order("chr1 200 100 p1 gneg\n");
  BOOST_CHECK_THROW( parseCytobandIdeo(ss_order, chromosomes), MalformedAnnotationLine );

  stringstream ss_coord("chr1 0 1e3 p1 gneg\n");
  BOOST_CHECK_THROW( parseCytobandIdeo(ss_coord, chromosomes), MalformedAnnotationLine );
}

/* missing annotation file */
BOOST_AUTO_TEST_CASE( annotation_missing )
{
  fs::path p = fs::temp_directory_path() / fs::unique_path("genomeplot-missing-%%%%-%%%%.txt");
  BOOST_CHECK_THROW( readChromSizes(p.string(), chromosomes), std::runtime_error );
  BOOST_CHECK_THROW( readCytobandIdeo(p.string(), chromosomes), std::runtime_error );
}

/* read BED records, skipping headers and malformed lines */
BOOST_AUTO_TEST_CASE( bed )
{
  stringstream ss;
  ss << "track name=test\n"
     << "browser position chr1:1-100\n"
     << "# comment\n"
     << "chr1\t10\t20\tfeat1\t0\t+\n"
     << "chr1\t30\n"
     << "chr2\tx\t40\n"
     << "chr2\t50\t40\n"
     << "chr2\t-1\t40\n"
     << "chr2\t100\t200\n";

  BedFile bed;
  BOOST_CHECK( bed.parseBed(ss) );
  BOOST_CHECK( bed.m_num_recs == 2 );
  BOOST_CHECK( bed.m_num_skipped == 4 );

  vector<Interval> intervals;
  bed.getIntervals(intervals);
  BOOST_REQUIRE( intervals.size() == 2 );
  BOOST_CHECK( intervals[0] == Interval("chr1", 10, 20) );
  BOOST_CHECK( intervals[1] == Interval("chr2", 100, 200) );

  fs::path p = fs::temp_directory_path() / fs::unique_path("genomeplot-missing-%%%%-%%%%.bed");
  BOOST_CHECK_THROW( BedFile bed_missing(p.string()), DatasetReadError );
}

/* datasets keep input order, unreadable files are dropped */
BOOST_AUTO_TEST_CASE( datasets )
{
  boost::timer::auto_cpu_timer t;
  string fn_a = writeTmp("chr1\t0\t100\nchr1\t200\t300\n");
  string fn_b = writeTmp("chr2\t0\t100\n");
  string fn_c = writeTmp("chr3\t0\t100\nchr3\t5\t10\nchr3\t7\t9\n");
  fs::path fn_missing = fs::temp_directory_path() / fs::unique_path("genomeplot-missing-%%%%-%%%%.bed");

  vector<string> filenames = { fn_a, fn_missing.string(), fn_b, fn_c };
  vector<string> labels = { "a", "missing", "" };
  vector<Dataset> datasets = loadDatasets(filenames, labels, 2);

  BOOST_REQUIRE( datasets.size() == 3 );
  BOOST_CHECK( datasets[0].label == "a" );
  BOOST_CHECK( datasets[0].intervals.size() == 2 );
  // empty and missing labels fall back to the file name
  BOOST_CHECK( datasets[1].label == fn_b );
  BOOST_CHECK( datasets[1].intervals.size() == 1 );
  BOOST_CHECK( datasets[2].label == fn_c );
  BOOST_CHECK( datasets[2].intervals.size() == 3 );
}

/* a path that opens but cannot be read is dropped like a missing one */
BOOST_AUTO_TEST_CASE( datasets_directory )
{
  fs::path dir = fs::temp_directory_path() / fs::unique_path("genomeplot-dir-%%%%-%%%%.bed");
  BOOST_REQUIRE( fs::create_directory(dir) );
  tmp_files.push_back(dir.string());
  string fn_a = writeTmp("chr1\t0\t100\n");

  BOOST_CHECK_THROW( BedFile bed_dir(dir.string()), DatasetReadError );

  vector<Dataset> datasets = loadDatasets({ dir.string(), fn_a }, { "dir", "a" }, 2);
  BOOST_REQUIRE( datasets.size() == 1 );
  BOOST_CHECK( datasets[0].label == "a" );
  BOOST_CHECK( datasets[0].intervals.size() == 1 );
}

BOOST_AUTO_TEST_SUITE_END()
