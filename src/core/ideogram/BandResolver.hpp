#ifndef BANDRESOLVER_H
#define BANDRESOLVER_H

#include "../seqio/Chromosome.hpp"
#include "../seqio/Cytoband.hpp"
#include "../seqio/Interval.hpp"
#include "../seqio/types.hpp"
#include <string>
#include <vector>

/** Geometry and appearance of chromosome ideograms. */
namespace ideogram {

/** How a chromosome is drawn. */
enum RenderMode {
  FLAT_BAR, /** no cytobands: plain bar */
  ARMS      /** cytobands drawn inside one or two arms */
};

/** Fill opacity for a Giemsa stain code. */
double getStainOpacity(const std::string& stain);
/** True for stains that get a hatch overlay (gvar, stalk). */
bool hasHatchFill(const std::string& stain);
/** False for stains that only mark the arm boundary (acen). */
bool isDrawnBand(const std::string& stain);

/** A cytoband resolved to raster coordinates. */
struct BandFill
{
  seqio::Cytoband band;
  double x;       /** band.start / scale */
  double width;   /** (band.end - band.start) / scale */
  double opacity;
  bool hatch;
};

/** A chromosome arm resolved to raster coordinates. */
struct ArmGeometry
{
  seqio::Interval arm;
  double x;
  double width;
  /** identifier of the clip region shaped like the arm */
  std::string clip_id;
  /** bands overlapping the arm, in canonical order */
  std::vector<BandFill> bands;
};

/** Everything needed to draw a chromosome's ideogram. */
struct ChromosomeGlyph
{
  RenderMode mode;
  /** bar width (FLAT_BAR mode): length / scale */
  double bar_width;
  std::vector<ArmGeometry> arms;

  ChromosomeGlyph();
};

/**
 * Split a chromosome into arms.
 *
 * With a centromere the arms are [0, centromere.start) and
 * [centromere.end, length), otherwise a single arm covers the whole
 * chromosome. Chromosomes without cytobands have no arms.
 */
std::vector<seqio::Interval> getArms(const seqio::Chromosome& chromosome);

/** Resolve the bands overlapping an arm. */
std::vector<BandFill> resolveBands (
  const seqio::Chromosome& chromosome,
  const seqio::Interval& arm,
  seqio::TCoord scale
);

/** Resolve a chromosome's ideogram in raster coordinates (position/scale). */
ChromosomeGlyph resolveChromosome(const seqio::Chromosome& chromosome, seqio::TCoord scale);

} // namespace ideogram

#endif // BANDRESOLVER_H
