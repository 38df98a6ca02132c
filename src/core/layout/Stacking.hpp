#ifndef STACKING_H
#define STACKING_H

#include "../seqio/Chromosome.hpp"
#include "../seqio/ChromosomeSet.hpp"
#include <memory>
#include <vector>

/** Arrangement of chromosomes on the canvas. */
namespace layout {

/** Ordered list of chromosomes. */
typedef
std::vector<std::shared_ptr<seqio::Chromosome>>
TChromosomeList;

/** One row of the plot, holding one or two chromosomes. */
typedef
std::vector<std::shared_ptr<seqio::Chromosome>>
TStack;

/** All rows of the plot, top to bottom. */
typedef
std::vector<TStack>
TStackSet;

/**
 * Return chromosomes in canonical order, keeping a chromosome iff
 *   (include_non_regular OR regular) OR (include_mito AND mitochondrial)
 */
TChromosomeList filterChromosomes (
  const seqio::ChromosomeSet& chromosomes,
  bool include_non_regular,
  bool include_mito
);

/**
 * Pair chromosomes complementarily into rows.
 *
 * The first half (rounded up) of the list opens one row each; element
 * half+k is appended to row half-1-k. For an even number of chromosomes
 * row 0 holds the first and the last chromosome, row 1 the second and
 * second-to-last, etc. For an odd number row 0 stays single.
 *
 *   [c1 c2 c3 c4 c5 c6] -> [[c1 c6] [c2 c5] [c3 c4]]
 *   [c1 c2 c3 c4 c5]    -> [[c1] [c2 c5] [c3 c4]]
 */
TStackSet stackPairs(const TChromosomeList& chromosomes);

/**
 * Two-column arrangement: numbered chromosomes and all others are
 * paired separately, numbered rows come first.
 */
TStackSet getStackedChromosomes(const TChromosomeList& chromosomes);

/** Single-column arrangement: one row per chromosome. */
TStackSet getSingleStacks(const TChromosomeList& chromosomes);

} // namespace layout

#endif // STACKING_H
