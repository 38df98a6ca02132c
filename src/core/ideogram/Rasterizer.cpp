#include "Rasterizer.hpp"
#include <memory>

using namespace std;
using seqio::Chromosome;

namespace ideogram {

unsigned long rasterizeDataset (
  const seqio::ChromosomeSet& chromosomes,
  const seqio::Dataset& dataset,
  seqio::TCoord scale
)
{
  for (auto const & sp_chr : chromosomes.getChromosomes()) {
    sp_chr->initLabel(dataset.label, scale);
  }

  unsigned long num_counted = 0;
  for (auto const & itv : dataset.intervals) {
    shared_ptr<Chromosome> sp_chr = chromosomes.getChromosome(itv.id_chr);
    if (!sp_chr)
      continue;
    sp_chr->addInterval(dataset.label, itv, scale);
    num_counted++;
  }
  return num_counted;
}

} // namespace ideogram
