#ifndef LAYOUTCALCULATOR_H
#define LAYOUTCALCULATOR_H

#include "Stacking.hpp"
#include "../seqio/Chromosome.hpp"
#include "../seqio/types.hpp"
#include <string>
#include <vector>

namespace layout {

/** Average glyph width relative to the text size. */
const double TEXT_RATIO = 0.6;
/** Space reserved around every chromosome entry. */
const double BORDER_GAP = 1.0;

/** Measures rendered text. */
class TextMetrics
{
public:
  virtual ~TextMetrics() {}
  virtual double getTextWidth(const std::string& text, double text_size) const = 0;
};

/** Closed-form text width: characters x TEXT_RATIO x text size */
class ApproxTextMetrics : public TextMetrics
{
public:
  double getTextWidth(const std::string& text, double text_size) const;
};

/** Dimensions controlling the plot layout (all lengths in px). */
struct LayoutParams
{
  seqio::TCoord scale;          /** base pairs per px */
  double text_size;             /** label font size */
  double text_gap;              /** gap between label and chromosome */
  double horizontal_gap;        /** gap between the two columns */
  double track_height;          /** height of one dataset track */
  double in_gap;                /** gap between dataset tracks */
  double cytoband_height;       /** height of the ideogram */
  double chromosome_bar_height; /** height of the plain chromosome bar */
  double gap;                   /** vertical gap between rows */
  bool two_column;              /** chromosomes are stacked in pairs */

  LayoutParams();
};

/** Canvas dimensions computed for a stack set. */
struct LayoutResult
{
  double width;
  double height;
  /** height of one chromosome entry (tracks + ideogram) */
  double entry_height;
  /** label width per column */
  std::vector<double> label_width;
  size_t num_tracks;
  bool draw_cytobands;

  LayoutResult();
};

/** Position of one chromosome entry on the canvas. */
struct EntryPlacement
{
  /** viewport of the entry */
  double x;
  double y;
  double width;
  double height;
  /** raster width of the chromosome: length/scale + 1 */
  double raster_width;
  /** vertical offset of the ideogram/bar within the entry */
  double chromosome_y;
  /** label anchor point */
  double label_x;
  double label_y;
  /** true: label ends at label_x (left column), false: starts there */
  bool label_anchor_end;
};

/**
 * Compute canvas width, height and label widths.
 *
 * \param stacks          rows of the plot
 * \param num_tracks      number of successfully loaded datasets
 * \param draw_cytobands  ideograms are drawn (instead of plain bars)
 * \param params          layout dimensions
 * \param metrics         text measurement
 */
LayoutResult calcLayout (
  const TStackSet& stacks,
  size_t num_tracks,
  bool draw_cytobands,
  const LayoutParams& params,
  const TextMetrics& metrics
);
LayoutResult calcLayout (
  const TStackSet& stacks,
  size_t num_tracks,
  bool draw_cytobands,
  const LayoutParams& params
);

/** Height of one entry: tracks plus ideogram (or bar). */
double calcEntryHeight(size_t num_tracks, bool draw_cytobands, const LayoutParams& params);

/**
 * Place a chromosome entry.
 *
 * Left column entries start right after the label gutter, right column
 * entries are right-aligned against the right label gutter.
 */
EntryPlacement placeEntry (
  const LayoutResult& layout,
  const LayoutParams& params,
  const seqio::Chromosome& chromosome,
  size_t stack_idx,
  size_t col_idx
);

} // namespace layout

#endif // LAYOUTCALCULATOR_H
