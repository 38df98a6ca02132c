#include "Cytoband.hpp"

using namespace std;

namespace seqio {

Cytoband::Cytoband() {}

Cytoband::Cytoband(const Interval& region, string stain)
: region(region), stain(stain) {}

bool Cytoband::isCentromeric() const {
  return stain == "acen";
}

bool operator<(const Cytoband& lhs, const Cytoband& rhs) {
  return lhs.region < rhs.region;
}

} // namespace seqio
