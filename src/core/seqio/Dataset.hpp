#ifndef DATASET_H
#define DATASET_H

#include "Interval.hpp"
#include <string>
#include <vector>

namespace seqio {

/** An interval dataset together with the label of its track. */
struct Dataset
{
  std::string label;
  std::string filename;
  std::vector<Interval> intervals;

  Dataset();
  Dataset(std::string label, std::string filename);
};

/**
 * Read interval datasets from BED files.
 *
 * Files are read in parallel (OpenMP). A file that cannot be read is
 * reported and dropped; the result keeps the input order of all
 * successfully read files. Files without a label are labelled by their
 * file name.
 *
 * \param filenames    BED files to read
 * \param labels       track labels (paired with file names, may be shorter)
 * \param num_threads  number of parallel threads
 */
std::vector<Dataset> loadDatasets (
  const std::vector<std::string>& filenames,
  const std::vector<std::string>& labels,
  int num_threads = 1
);

} // namespace seqio

#endif // DATASET_H
