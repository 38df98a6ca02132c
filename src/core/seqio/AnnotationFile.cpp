#include "AnnotationFile.hpp"
#include "../stringio.hpp"
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <stdexcept>
#include <vector>

using namespace std;

namespace seqio {

namespace {

/** Convert coordinate column, rejecting negative or non-numeric values. */
TCoord parseCoord (
  const string& token,
  const char* column,
  const string& filename,
  unsigned long line_no
)
{
  if (token.empty() || token[0] == '-' || token[0] == '+') {
    throw MalformedAnnotationLine(filename, line_no, str(boost::format("invalid %s '%s'") % column % token));
  }
  try {
    return boost::lexical_cast<TCoord>(token);
  } catch (const boost::bad_lexical_cast&) {
    throw MalformedAnnotationLine(filename, line_no, str(boost::format("invalid %s '%s'") % column % token));
  }
}

/** Blank and comment lines carry no records. */
bool isSkippable(const string& line) {
  string s = stringio::trim(line);
  return s.empty() || s[0] == '#';
}

void openOrThrow(ifstream& input, const string& filename) {
  input.open(filename, ios::in);
  if (!input.is_open()) {
    throw runtime_error(str(boost::format("Could not open annotation file '%s'") % filename));
  }
}

} // anonymous namespace

unsigned long parseChromSizes (
  istream& input,
  ChromosomeSet& chromosomes,
  const string& filename
)
{
  string line;
  unsigned long line_no = 0;
  while (stringio::safeGetline(input, line)) {
    line_no++;
    if (isSkippable(line)) continue;
    vector<string> row = stringio::tokenize(line);
    if (row.size() < 2) {
      throw MalformedAnnotationLine(filename, line_no, ">=2 columns expected");
    }
    TCoord size = parseCoord(row[1], "size", filename, line_no);
    chromosomes.addChromosome(row[0], size);
  }
  return line_no;
}

unsigned long parseCytobandIdeo (
  istream& input,
  ChromosomeSet& chromosomes,
  const string& filename
)
{
  string line;
  unsigned long line_no = 0;
  while (stringio::safeGetline(input, line)) {
    line_no++;
    if (isSkippable(line)) continue;
    vector<string> row = stringio::tokenize(line);
    // unplaced contigs come with a blank band name
    if (row.size() == 4) {
      row.insert(row.begin()+3, string());
    }
    if (row.size() < 5) {
      throw MalformedAnnotationLine(filename, line_no, ">=4 columns expected");
    }
    TCoord start = parseCoord(row[1], "chromStart", filename, line_no);
    TCoord end = parseCoord(row[2], "chromEnd", filename, line_no);
    if (end < start) {
      throw MalformedAnnotationLine(filename, line_no, "chromEnd < chromStart");
    }
    chromosomes.addCytoband(Cytoband(Interval(row[0], start, end, row[3]), row[4]));
  }
  return line_no;
}

void readChromSizes(const string& filename, ChromosomeSet& chromosomes) {
  ifstream input;
  openOrThrow(input, filename);
  parseChromSizes(input, chromosomes, filename);
  input.close();
}

void readCytobandIdeo(const string& filename, ChromosomeSet& chromosomes) {
  ifstream input;
  openOrThrow(input, filename);
  parseCytobandIdeo(input, chromosomes, filename);
  input.close();
}

} // namespace seqio
