#include "Interval.hpp"
#include <algorithm> // min(), max()

using namespace std;

namespace seqio {

Interval::Interval() : start(0), end(0) {}
Interval::Interval(string id, TCoord start, TCoord end, string name)
: id_chr(id), start(start), end(end), name(name) {}
Interval::~Interval() {}

TCoord Interval::length() const {
  return end - start;
}

bool Interval::overlaps(const Interval& other) const {
  if (id_chr != other.id_chr)
    return false;
  return (start < other.end) && (other.start < end);
}

void Interval::merge(const Interval& other) {
  start = min(start, other.start);
  end = max(end, other.end);
}

int compare(const Interval& lhs, const Interval& rhs) {
  int c = lhs.id_chr.compare(rhs.id_chr);
  if (c != 0)
    return c < 0 ? -1 : 1;
  if (lhs.start != rhs.start)
    return lhs.start < rhs.start ? -1 : 1;
  if (lhs.end != rhs.end)
    return lhs.end < rhs.end ? -1 : 1;
  return 0;
}

bool operator<(const Interval& lhs, const Interval& rhs) {
  return compare(lhs, rhs) < 0;
}

bool operator==(const Interval& lhs, const Interval& rhs) {
  return compare(lhs, rhs) == 0;
}

ostream& operator<<(ostream& os, const Interval& itv) {
  os << itv.id_chr << ":" << itv.start << "-" << itv.end;
  return os;
}

} // namespace seqio
