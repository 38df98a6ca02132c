#include "BedFile.hpp"
#include "../stringio.hpp"
#include <boost/lexical_cast.hpp>
#include <cstdio>
#include <fstream>
#include <ios>

using namespace std;

namespace seqio {

BedFile::BedFile() :
  m_num_recs(0),
  m_num_skipped(0)
{}

BedFile::BedFile(const string& filename) :
  m_num_recs(0),
  m_num_skipped(0)
{
  ifstream inputFile;
  inputFile.open(filename, ios::in);
  if (!inputFile.is_open()) {
    throw DatasetReadError(filename);
  }
  // reading a directory or a failing device throws from the stream buffer
  try {
    if (!this->parseBed(inputFile, filename)) {
      throw DatasetReadError(filename);
    }
  } catch (const ios_base::failure& e) {
    fprintf(stderr, "[ERROR] (BedFile::BedFile) %s: %s\n", filename.c_str(), e.what());
    throw DatasetReadError(filename);
  }
  inputFile.close();
}

bool
BedFile::parseBed(istream& input, const string& filename) {
  string line;
  unsigned long line_no = 0;

  while (stringio::safeGetline(input, line)) {
    line_no++;
    // split line into fields
    vector<string> row = stringio::tokenize(line);
    // skip blank, comment and header lines
    if (row.empty() || row[0][0] == '#' || row[0] == "track" || row[0] == "browser")
      continue;
    if (row.size() < 3) {
      fprintf(stderr, "[WARN] (BedFile::parseBed) %s:%lu: >=3 columns expected, skipping line.\n", filename.c_str(), line_no);
      this->m_num_skipped++;
      continue;
    }
    TCoord start, end;
    try {
      if (row[1][0] == '-' || row[2][0] == '-')
        throw boost::bad_lexical_cast();
      start = boost::lexical_cast<TCoord>(row[1]);
      end = boost::lexical_cast<TCoord>(row[2]);
    } catch (const boost::bad_lexical_cast&) {
      fprintf(stderr, "[WARN] (BedFile::parseBed) %s:%lu: invalid coordinates, skipping line.\n", filename.c_str(), line_no);
      this->m_num_skipped++;
      continue;
    }
    if (end < start) {
      fprintf(stderr, "[WARN] (BedFile::parseBed) %s:%lu: end < start, skipping line.\n", filename.c_str(), line_no);
      this->m_num_skipped++;
      continue;
    }
    this->m_vec_seqid.push_back(row[0]);
    this->m_vec_start.push_back(start);
    this->m_vec_end.push_back(end);
    this->m_num_recs++;
  }

  if (input.bad()) {
    fprintf(stderr, "[ERROR] (BedFile::parseBed) %s: read error after line %lu.\n", filename.c_str(), line_no);
    return false;
  }
  return true;
}

void BedFile::getIntervals ( vector<Interval>& out_intervals ) const {
  out_intervals.clear();
  for (size_t i=0; i<this->m_num_recs; i++) {
    out_intervals.push_back(Interval(this->m_vec_seqid[i], this->m_vec_start[i], this->m_vec_end[i]));
  }
}

} /* namespace seqio */
