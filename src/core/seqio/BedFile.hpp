#ifndef BEDFILE_H
#define BEDFILE_H

#include "Interval.hpp"
#include "exceptions.hpp"
#include "types.hpp"
#include <istream>
#include <string>
#include <vector>

namespace seqio {

/**
 * Reads interval datasets from BED files.
 *
 * A BED file is expected to have three required columns:
 *   1. seq_id : Identifier for a sequence (e.g. chromosome)
 *   2. start  : Start coordinate (0-based, inclusive)
 *   3. end    : End coordinate (0-based, exclusive)
 *
 * Additional columns (name, score, strand, ...) are ignored, as are
 * "track", "browser" and comment lines.
 */
struct BedFile {

/** Number of records in this BED file. */
size_t m_num_recs;
/** Number of lines that could not be parsed. */
size_t m_num_skipped;
/** Sequence IDs. */
std::vector<std::string> m_vec_seqid;
/** Start coordinates (0-based, inclusive). */
std::vector<TCoord> m_vec_start;
/** End coordinates (0-based, exclusive). */
std::vector<TCoord> m_vec_end;

/** default c'tor */
BedFile();
/** Initialize from existing BED file; throws DatasetReadError. */
BedFile(const std::string& filename);

/** Get records from BED stream. Malformed lines are skipped. */
bool parseBed(std::istream& input, const std::string& filename = "<stream>");

/** Return genomic records as list of Interval objects. */
void getIntervals(std::vector<Interval>& out_intervals) const;

};

} /* namespace seqio */

#endif /* BEDFILE_H */
