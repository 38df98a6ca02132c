#ifndef CHROMOSOME_H
#define CHROMOSOME_H

#include "Cytoband.hpp"
#include "Interval.hpp"
#include "types.hpp"
#include <boost/optional.hpp>
#include <memory>
#include <string>
#include <vector>

namespace seqio {

/** Represents one chromosome (or contig) of the plotted genome.
 *
 *  Holds the banding structure read from the annotation and, for every
 *  dataset label, a histogram of interval coverage in raster bins.
 */
struct Chromosome {
   /** chromosome identifier (e.g. "chr1"). */
   std::string id;
   /** total length; never shorter than the last cytoband. */
   TCoord length;
   /** cytobands, kept in canonical order. */
   std::vector<Cytoband> cytobands;
   /** merged span of all "acen" bands (if any). */
   boost::optional<Cytoband> centromere;
   /** raster bins per dataset label. */
   TLabelBins data;

   /** default c'tor */
   Chromosome();
   Chromosome(std::string id, TCoord length);

   /** The whole chromosome as an interval [0, length). */
   Interval getRegion() const;

   /**
    * Add a cytoband to this chromosome.
    *
    * Keeps the band list sorted, merges "acen" bands into the centromere
    * and grows the chromosome if the band ends past its current length.
    */
   void addCytoband(const Cytoband& band);

   /** True if cytoband information is available. */
   bool hasCytobands() const;

   /** Number of raster bins at the given scale: ceil(length/scale)+1 */
   size_t getNumBins(TCoord scale) const;

   /**
    * Allocate the raster for a dataset label.
    *
    * \returns false (and leaves existing counts untouched) if the label
    *          has been initialized before
    */
   bool initLabel(const std::string& label, TCoord scale);

   /**
    * Count an interval into the raster of a dataset label.
    *
    * Every bin from round(start/scale) to round(end/scale) (inclusive) is
    * incremented. Intervals on other chromosomes are ignored, bins beyond
    * the end of the raster are dropped.
    * Throws std::out_of_range if the label has not been initialized.
    */
   void addInterval(const std::string& label, const Interval& itv, TCoord scale);

   /** Name looks like a numbered chromosome (chr1, chr22, ...). */
   bool isNumbered() const;
   /** Excludes unplaced ("chrUn"), alternative/random ("_") and "chrM". */
   bool isRegular() const;
   /** Mitochondrial chromosome ("chrM"). */
   bool isMitochondrial() const;
 };

/** Canonical ordering of chromosomes (by region). */
bool compareChromosomes (
  const std::shared_ptr<Chromosome>& lhs,
  const std::shared_ptr<Chromosome>& rhs
);

/** Convert a genomic position to a raster bin index: round(pos/scale) */
size_t posToBin(TCoord pos, TCoord scale);

} // namespace seqio

#endif // CHROMOSOME_H
