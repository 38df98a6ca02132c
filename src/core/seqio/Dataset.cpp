#include "Dataset.hpp"
#include "BedFile.hpp"
#include "exceptions.hpp"
#include <cstdio>
#ifdef _OPENMP
#include <omp.h>
#endif

using namespace std;

namespace seqio {

Dataset::Dataset() {}

Dataset::Dataset(string label, string filename)
: label(label), filename(filename) {}

vector<Dataset> loadDatasets (
  const vector<string>& filenames,
  const vector<string>& labels,
  int num_threads
)
{
  long num_files = static_cast<long>(filenames.size());
  vector<Dataset> slots(num_files);
  vector<char> loaded(num_files, 0);

#ifdef _OPENMP
  omp_set_num_threads(num_threads > 0 ? num_threads : 1);
#else
  (void)num_threads;
#endif

  #pragma omp parallel for schedule(dynamic)
  for (long i=0; i<num_files; ++i) {
    string fn = filenames[i];
    string lbl = ( size_t(i) < labels.size() && labels[i].size() > 0 ) ? labels[i] : fn;
    try {
      BedFile bed(fn);
      slots[i] = Dataset(lbl, fn);
      bed.getIntervals(slots[i].intervals);
      loaded[i] = 1;
    } catch (const DatasetReadError& e) {
      fprintf(stderr, "[ERROR] (loadDatasets) %s. Dataset '%s' is skipped.\n", e.what(), lbl.c_str());
    }
  }

  vector<Dataset> datasets;
  for (long i=0; i<num_files; ++i) {
    if (loaded[i]) {
      datasets.push_back(slots[i]);
    }
  }
  return datasets;
}

} // namespace seqio
