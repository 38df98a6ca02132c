#ifndef CYTOBAND_H
#define CYTOBAND_H

#include "Interval.hpp"
#include <string>

namespace seqio {

/** A Giemsa-stained band of a chromosome.
 *
 *  Stain codes: gneg, gpos<NN> (NN = 0-100), acen, gvar, stalk.
 */
struct Cytoband
{
  /** Band coordinates; name holds the band name (e.g. "p36.33"). */
  Interval region;
  /** Giemsa stain code. */
  std::string stain;

  Cytoband();
  Cytoband(const Interval& region, std::string stain);

  /** True for centromeric ("acen") bands. */
  bool isCentromeric() const;
};

/** Cytobands are ordered by their regions. */
bool operator<(const Cytoband& lhs, const Cytoband& rhs);

} // namespace seqio

#endif // CYTOBAND_H
