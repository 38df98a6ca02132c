#include "Stacking.hpp"
#include <algorithm> // sort()

using namespace std;
using seqio::Chromosome;
using seqio::ChromosomeSet;

namespace layout {

TChromosomeList filterChromosomes (
  const ChromosomeSet& chromosomes,
  bool include_non_regular,
  bool include_mito
)
{
  TChromosomeList sorted = chromosomes.getChromosomes();
  sort(sorted.begin(), sorted.end(), seqio::compareChromosomes);

  TChromosomeList result;
  for (auto const & sp_chr : sorted) {
    if ( (include_non_regular || sp_chr->isRegular()) ||
         (include_mito && sp_chr->isMitochondrial()) ) {
      result.push_back(sp_chr);
    }
  }
  return result;
}

TStackSet stackPairs(const TChromosomeList& chromosomes) {
  TStackSet stacks;
  size_t n = chromosomes.size();
  size_t half = (n + 1) / 2;
  for (size_t i=0; i<half; ++i) {
    stacks.push_back(TStack(1, chromosomes[i]));
  }
  for (size_t k=0; half+k<n; ++k) {
    stacks[half-1-k].push_back(chromosomes[half+k]);
  }
  return stacks;
}

TStackSet getStackedChromosomes(const TChromosomeList& chromosomes) {
  TChromosomeList numbered, others;
  for (auto const & sp_chr : chromosomes) {
    if (sp_chr->isNumbered())
      numbered.push_back(sp_chr);
    else
      others.push_back(sp_chr);
  }
  TStackSet stacks = stackPairs(numbered);
  TStackSet stacks_other = stackPairs(others);
  stacks.insert(stacks.end(), stacks_other.begin(), stacks_other.end());
  return stacks;
}

TStackSet getSingleStacks(const TChromosomeList& chromosomes) {
  TStackSet stacks;
  for (auto const & sp_chr : chromosomes) {
    stacks.push_back(TStack(1, sp_chr));
  }
  return stacks;
}

} // namespace layout
