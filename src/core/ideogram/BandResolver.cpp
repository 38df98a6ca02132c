#include "BandResolver.hpp"
#include <boost/lexical_cast.hpp>
#include <cctype> // isdigit()

using namespace std;
using seqio::Chromosome;
using seqio::Cytoband;
using seqio::Interval;
using seqio::TCoord;

namespace ideogram {

double getStainOpacity(const string& stain) {
  if (stain == "stalk")
    return 0.75;
  if (stain == "gpos100" || stain == "gvar")
    return 1.0;
  if (stain == "gneg")
    return 0.0;

  // intensity given by "gpos<NN>"
  const string pfx = "gpos";
  if (stain.compare(0, pfx.size(), pfx) != 0)
    return 0.0;
  size_t n = pfx.size();
  while (n < stain.size() && isdigit(static_cast<unsigned char>(stain[n])))
    n++;
  if (n == pfx.size())
    return 0.0;
  double value;
  try {
    value = boost::lexical_cast<double>(stain.substr(pfx.size(), n-pfx.size())) / 100;
  } catch (const boost::bad_lexical_cast&) {
    return 0.0;
  }
  if (value < 0.0)
    return 0.0;
  if (value > 1.0)
    return 1.0;
  return value;
}

bool hasHatchFill(const string& stain) {
  return stain == "gvar" || stain == "stalk";
}

bool isDrawnBand(const string& stain) {
  return stain != "acen";
}

ChromosomeGlyph::ChromosomeGlyph() : mode(FLAT_BAR), bar_width(0) {}

vector<Interval> getArms(const Chromosome& chromosome) {
  vector<Interval> arms;
  if (!chromosome.hasCytobands())
    return arms;
  if (chromosome.centromere) {
    const Interval& cen = chromosome.centromere->region;
    arms.push_back(Interval(chromosome.id, 0, cen.start, chromosome.id + "_arm_1"));
    arms.push_back(Interval(chromosome.id, cen.end, chromosome.length, chromosome.id + "_arm_2"));
  } else {
    arms.push_back(chromosome.getRegion());
  }
  return arms;
}

vector<BandFill> resolveBands (
  const Chromosome& chromosome,
  const Interval& arm,
  TCoord scale
)
{
  vector<BandFill> fills;
  for (auto const & band : chromosome.cytobands) {
    if (!isDrawnBand(band.stain) || !arm.overlaps(band.region))
      continue;
    BandFill fill;
    fill.band = band;
    fill.x = static_cast<double>(band.region.start) / scale;
    fill.width = static_cast<double>(band.region.length()) / scale;
    fill.opacity = getStainOpacity(band.stain);
    fill.hatch = hasHatchFill(band.stain);
    fills.push_back(fill);
  }
  return fills;
}

ChromosomeGlyph resolveChromosome(const Chromosome& chromosome, TCoord scale) {
  ChromosomeGlyph glyph;
  if (!chromosome.hasCytobands()) {
    glyph.mode = FLAT_BAR;
    glyph.bar_width = static_cast<double>(chromosome.length) / scale;
    return glyph;
  }
  glyph.mode = ARMS;
  for (auto const & arm : getArms(chromosome)) {
    ArmGeometry geo;
    geo.arm = arm;
    geo.x = static_cast<double>(arm.start) / scale;
    geo.width = static_cast<double>(arm.length()) / scale;
    geo.clip_id = arm.name;
    geo.bands = resolveBands(chromosome, arm, scale);
    glyph.arms.push_back(geo);
  }
  return glyph;
}

} // namespace ideogram
