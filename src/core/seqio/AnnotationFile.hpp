#ifndef ANNOTATIONFILE_H
#define ANNOTATIONFILE_H

#include "ChromosomeSet.hpp"
#include "exceptions.hpp"
#include "types.hpp"
#include <istream>
#include <string>

namespace seqio {

/**
 * Parse chromosome sizes (UCSC chrom.sizes format).
 *
 * Each line holds two whitespace-separated columns:
 *   1. name : chromosome name
 *   2. size : chromosome length (bp)
 *
 * The first occurrence of a name wins, later duplicates are ignored.
 *
 * \param input        stream to read from
 * \param chromosomes  output parameter, chromosomes are added to this set
 * \param filename     name reported in parse errors
 * \returns            number of lines read
 * \throws MalformedAnnotationLine
 */
unsigned long parseChromSizes (
  std::istream& input,
  ChromosomeSet& chromosomes,
  const std::string& filename = "<stream>"
);

/**
 * Parse a banding pattern (UCSC cytoBandIdeo format).
 *
 * Each line holds five whitespace-separated columns:
 *   1. chrom      : chromosome name
 *   2. chromStart : band start (0-based, inclusive)
 *   3. chromEnd   : band end (0-based, exclusive)
 *   4. name       : band name (may be blank)
 *   5. gieStain   : Giemsa stain code
 *
 * \throws MalformedAnnotationLine
 */
unsigned long parseCytobandIdeo (
  std::istream& input,
  ChromosomeSet& chromosomes,
  const std::string& filename = "<stream>"
);

/** Read chrom.sizes file; throws std::runtime_error if it cannot be opened. */
void readChromSizes(const std::string& filename, ChromosomeSet& chromosomes);

/** Read cytoBandIdeo file; throws std::runtime_error if it cannot be opened. */
void readCytobandIdeo(const std::string& filename, ChromosomeSet& chromosomes);

} // namespace seqio

#endif // ANNOTATIONFILE_H
