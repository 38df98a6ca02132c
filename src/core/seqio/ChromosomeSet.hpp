#ifndef CHROMOSOMESET_H
#define CHROMOSOMESET_H

#include "Chromosome.hpp"
#include "Cytoband.hpp"
#include "types.hpp"
#include <map>
#include <memory> // shared_ptr
#include <string>
#include <vector>

namespace seqio {

/** Insertion-ordered collection of chromosomes with lookup by name.
 *
 *  The collection is built during annotation ingestion and frozen
 *  afterwards; structural changes to a frozen set are rejected.
 *  Coverage data may still be added to the chromosomes of a frozen set.
 */
class ChromosomeSet
{
public:
  ChromosomeSet();

  /**
   * Add a chromosome unless one with that name exists.
   *
   * \returns the newly created or the already existing chromosome
   */
  std::shared_ptr<Chromosome> addChromosome(const std::string& id, TCoord length);

  /**
   * Add a cytoband, creating its chromosome (sized to the band end) on
   * first sight.
   */
  void addCytoband(const Cytoband& band);

  /** Get chromosome by name; empty pointer if unknown. */
  std::shared_ptr<Chromosome> getChromosome(const std::string& id) const;
  bool hasChromosome(const std::string& id) const;

  /** Chromosomes in insertion order. */
  const std::vector<std::shared_ptr<Chromosome>>& getChromosomes() const;
  size_t size() const;
  bool empty() const;

  /** True if any chromosome carries cytobands. */
  bool hasCytobands() const;

  /** End the ingestion phase. */
  void freeze();
  bool isFrozen() const;

private:
  void checkMutable(const char* caller) const;

  std::vector<std::shared_ptr<Chromosome>> m_vec_chr;
  std::map<std::string, std::shared_ptr<Chromosome>> m_map_id_chr;
  bool m_frozen;
};

} // namespace seqio

#endif // CHROMOSOMESET_H
