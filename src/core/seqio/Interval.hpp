#ifndef INTERVAL_H
#define INTERVAL_H

#include "types.hpp"
#include <ostream>
#include <string>

namespace seqio {

/** Represents a genomic interval.
 *
 *  Coordinates are 0-based and half-open: [start, end).
 */
struct Interval
{
  std::string id_chr; // chromosome the interval is located on
  TCoord      start;  // start position (0-based, inclusive)
  TCoord      end;    // end position (0-based, exclusive)
  std::string name;   // optional name (may be empty)

  Interval();
  Interval(std::string id, TCoord start, TCoord end, std::string name = "");
  ~Interval();

  /** Number of base pairs covered. */
  TCoord length() const;
  /** True if both intervals share at least one base pair. */
  bool overlaps(const Interval& other) const;
  /** Extend this interval so that it also covers another one. */
  void merge(const Interval& other);
};

/** Canonical ordering: chromosome name, then start, then end. */
bool operator<(const Interval& lhs, const Interval& rhs);
bool operator==(const Interval& lhs, const Interval& rhs);
/** Three-way compare following the canonical ordering. */
int compare(const Interval& lhs, const Interval& rhs);

std::ostream& operator<<(std::ostream& os, const Interval& itv);

} // namespace seqio

#endif // INTERVAL_H
