#ifndef SEQIO_TYPES_H
#define SEQIO_TYPES_H

#include <map>
#include <string>
#include <vector>

namespace seqio {

/** Represents genomic coordinates. */
typedef
unsigned long
TCoord;

/** Occupancy counts indexed by raster bin. */
typedef
std::vector<unsigned>
TBins;

/** Raster bins per dataset label. */
typedef
std::map<std::string, TBins>
TLabelBins;

} // namespace seqio

#endif // SEQIO_TYPES_H
