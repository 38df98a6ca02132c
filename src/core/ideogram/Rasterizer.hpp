#ifndef RASTERIZER_H
#define RASTERIZER_H

#include "../seqio/ChromosomeSet.hpp"
#include "../seqio/Dataset.hpp"
#include "../seqio/types.hpp"

namespace ideogram {

/**
 * Bin a dataset onto every chromosome of a set.
 *
 * Initializes the dataset's label on all chromosomes, then counts each
 * interval into the raster of its chromosome. Intervals on chromosomes
 * missing from the set are dropped.
 *
 * \returns number of intervals that were counted
 */
unsigned long rasterizeDataset (
  const seqio::ChromosomeSet& chromosomes,
  const seqio::Dataset& dataset,
  seqio::TCoord scale
);

} // namespace ideogram

#endif // RASTERIZER_H
