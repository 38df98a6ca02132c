#include "Chromosome.hpp"
#include <algorithm> // sort()
#include <cmath> // floor()
#include <cstdio>
#include <regex>

using namespace std;

namespace seqio {

Chromosome::Chromosome() : length(0) {}

Chromosome::Chromosome(string id, TCoord length)
: id(id), length(length) {}

Interval Chromosome::getRegion() const {
  return Interval(id, 0, length, id);
}

void Chromosome::addCytoband(const Cytoband& band) {
  cytobands.push_back(band);
  if (band.isCentromeric()) {
    if (centromere) {
      centromere->region.merge(band.region);
    } else {
      centromere = band;
    }
  }
  if (length < band.region.end) {
    length = band.region.end;
  }
  sort(cytobands.begin(), cytobands.end());
}

bool Chromosome::hasCytobands() const {
  return !cytobands.empty();
}

size_t Chromosome::getNumBins(TCoord scale) const {
  return (length + scale - 1) / scale + 1;
}

bool Chromosome::initLabel(const string& label, TCoord scale) {
  if (data.count(label) > 0) {
    fprintf(stderr, "[WARN] (Chromosome::initLabel) Data already exists for label '%s' on '%s'.\n", label.c_str(), id.c_str());
    return false;
  }
  data[label] = TBins(getNumBins(scale), 0);
  return true;
}

void Chromosome::addInterval(const string& label, const Interval& itv, TCoord scale) {
  if (itv.id_chr != id)
    return;
  TBins& bins = data.at(label);
  size_t first = posToBin(itv.start, scale);
  size_t last = posToBin(itv.end, scale);
  for (size_t i=first; i<=last && i<bins.size(); ++i) {
    bins[i]++;
  }
}

bool Chromosome::isNumbered() const {
  static const regex rgx("chr[0-9]+", regex::icase);
  return regex_search(id, rgx);
}

bool Chromosome::isRegular() const {
  static const regex rgx("(chrUn)|_|(chrM)");
  return !regex_search(id, rgx);
}

bool Chromosome::isMitochondrial() const {
  static const regex rgx("^chrM$", regex::icase);
  return regex_search(id, rgx);
}

bool compareChromosomes (
  const shared_ptr<Chromosome>& lhs,
  const shared_ptr<Chromosome>& rhs
)
{
  return lhs->getRegion() < rhs->getRegion();
}

size_t posToBin(TCoord pos, TCoord scale) {
  return static_cast<size_t>(floor(static_cast<double>(pos) / scale + 0.5));
}

} // namespace seqio
