#ifndef GENOMEPLOT_H
#define GENOMEPLOT_H

#include "Canvas.hpp"
#include "../layout/LayoutCalculator.hpp"
#include "../layout/Stacking.hpp"
#include "../seqio/Chromosome.hpp"
#include <string>
#include <vector>

namespace draw {

/** Track colors (Paul Tol's "Muted" qualitative scheme). */
extern const std::vector<std::string> COLOR_PALETTE;
/** Fill color of stained bands. */
extern const std::string CYTOBAND_COLOR;
/** Pattern id of the hatch overlay for gvar/stalk bands. */
extern const std::string HATCH_FILL_ID;
/** Font of chromosome labels. */
extern const std::string LABEL_FONT;

/** Color of the track at the given index. */
const std::string& getTrackColor(size_t idx_track);

/** Drawing options on top of the layout. */
struct PlotParams
{
  layout::LayoutParams layout;
  /** outline raster cells, making tiny features more visible */
  bool with_borders;

  PlotParams();
};

/**
 * Composes a genome plot from stacked chromosomes.
 *
 * The layout is computed once on construction and then handed to a
 * Canvas, one chromosome entry at a time.
 */
class GenomePlot
{
public:
  /**
   * \param stacks          rows of the plot
   * \param labels          labels of the successfully loaded datasets
   * \param draw_cytobands  draw ideograms (otherwise plain bars)
   * \param params          drawing options
   */
  GenomePlot (
    const layout::TStackSet& stacks,
    const std::vector<std::string>& labels,
    bool draw_cytobands,
    const PlotParams& params
  );

  const layout::LayoutResult& getLayout() const;

  /** Draw the complete document. */
  void draw(Canvas& canvas) const;

private:
  void drawEntry(Canvas& canvas, const seqio::Chromosome& chr, size_t idx_stack, size_t idx_col) const;
  void drawData(Canvas& canvas, const seqio::Chromosome& chr) const;
  void drawIdeogram(Canvas& canvas, const seqio::Chromosome& chr, double y) const;

  layout::TStackSet m_stacks;
  std::vector<std::string> m_labels;
  PlotParams m_params;
  layout::LayoutResult m_layout;
};

} // namespace draw

#endif // GENOMEPLOT_H
