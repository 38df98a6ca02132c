#include "ChromosomeSet.hpp"
#include <boost/format.hpp>
#include <stdexcept>

using namespace std;

namespace seqio {

ChromosomeSet::ChromosomeSet() : m_frozen(false) {}

shared_ptr<Chromosome> ChromosomeSet::addChromosome(const string& id, TCoord length) {
  checkMutable("addChromosome");
  auto it = m_map_id_chr.find(id);
  if (it != m_map_id_chr.end()) {
    return it->second;
  }
  shared_ptr<Chromosome> sp_chr(new Chromosome(id, length));
  m_vec_chr.push_back(sp_chr);
  m_map_id_chr[id] = sp_chr;
  return sp_chr;
}

void ChromosomeSet::addCytoband(const Cytoband& band) {
  checkMutable("addCytoband");
  shared_ptr<Chromosome> sp_chr = addChromosome(band.region.id_chr, band.region.end);
  sp_chr->addCytoband(band);
}

shared_ptr<Chromosome> ChromosomeSet::getChromosome(const string& id) const {
  auto it = m_map_id_chr.find(id);
  if (it == m_map_id_chr.end()) {
    return shared_ptr<Chromosome>();
  }
  return it->second;
}

bool ChromosomeSet::hasChromosome(const string& id) const {
  return m_map_id_chr.count(id) > 0;
}

const vector<shared_ptr<Chromosome>>& ChromosomeSet::getChromosomes() const {
  return m_vec_chr;
}

size_t ChromosomeSet::size() const {
  return m_vec_chr.size();
}

bool ChromosomeSet::empty() const {
  return m_vec_chr.empty();
}

bool ChromosomeSet::hasCytobands() const {
  for (auto const & sp_chr : m_vec_chr) {
    if (sp_chr->hasCytobands())
      return true;
  }
  return false;
}

void ChromosomeSet::freeze() {
  m_frozen = true;
}

bool ChromosomeSet::isFrozen() const {
  return m_frozen;
}

void ChromosomeSet::checkMutable(const char* caller) const {
  if (m_frozen) {
    throw logic_error(str(boost::format("ChromosomeSet::%s: chromosome set is frozen.") % caller));
  }
}

} // namespace seqio
