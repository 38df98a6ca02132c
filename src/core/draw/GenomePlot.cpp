#include "GenomePlot.hpp"
#include "../ideogram/BandResolver.hpp"

using namespace std;
using layout::EntryPlacement;
using layout::LayoutResult;
using layout::TStackSet;
using seqio::Chromosome;
using seqio::TBins;

namespace draw {

const vector<string> COLOR_PALETTE = {
  "#CC6677", // rose
  "#332288", // indigo
  "#DDCC77", // sand
  "#117733", // green
  "#88CCEE", // cyan
  "#882255", // wine
  "#44AA99", // teal
  "#999933", // olive
  "#AA4499"  // purple
};
const string CYTOBAND_COLOR = "#777777";
const string HATCH_FILL_ID = "hatch_fill";
const string LABEL_FONT = "Arial, Helvetica, sans-serif";

const string& getTrackColor(size_t idx_track) {
  return COLOR_PALETTE[idx_track % COLOR_PALETTE.size()];
}

PlotParams::PlotParams() : with_borders(false) {}

GenomePlot::GenomePlot (
  const TStackSet& stacks,
  const vector<string>& labels,
  bool draw_cytobands,
  const PlotParams& params
)
: m_stacks(stacks),
  m_labels(labels),
  m_params(params)
{
  m_layout = layout::calcLayout(m_stacks, m_labels.size(), draw_cytobands, m_params.layout);
}

const LayoutResult& GenomePlot::getLayout() const {
  return m_layout;
}

void GenomePlot::draw(Canvas& canvas) const {
  canvas.begin(m_layout.width, m_layout.height);
  canvas.defineHatchPattern(HATCH_FILL_ID, 8, 2, 60, "#000000");
  for (size_t i=0; i<m_stacks.size(); ++i) {
    for (size_t j=0; j<m_stacks[i].size(); ++j) {
      drawEntry(canvas, *m_stacks[i][j], i, j);
    }
  }
  canvas.end();
}

void GenomePlot::drawEntry (
  Canvas& canvas,
  const Chromosome& chr,
  size_t idx_stack,
  size_t idx_col
) const
{
  const double border = layout::BORDER_GAP;
  EntryPlacement p = layout::placeEntry(m_layout, m_params.layout, chr, idx_stack, idx_col);

  canvas.beginViewport(p.x, p.y, p.width, p.height,
                       -border, -border, p.width, p.height);
  drawData(canvas, chr);
  drawIdeogram(canvas, chr, p.chromosome_y);
  canvas.endViewport();

  // label goes outside of the entry's viewport
  canvas.drawText(p.label_x, p.label_y, chr.id,
                  p.label_anchor_end ? ANCHOR_END : ANCHOR_START,
                  m_params.layout.text_size, LABEL_FONT);
}

void GenomePlot::drawData(Canvas& canvas, const Chromosome& chr) const {
  const layout::LayoutParams& lp = m_params.layout;
  for (size_t idx_lbl=0; idx_lbl<m_labels.size(); ++idx_lbl) {
    auto it = chr.data.find(m_labels[idx_lbl]);
    if (it == chr.data.end())
      continue;
    const TBins& bins = it->second;
    RectStyle style;
    style.fill = getTrackColor(idx_lbl);
    if (m_params.with_borders) {
      style.stroke = style.fill;
      style.stroke_width = 1;
    }
    double y = idx_lbl * (lp.track_height + lp.in_gap);
    for (size_t idx_bin=0; idx_bin<bins.size(); ++idx_bin) {
      if (bins[idx_bin] == 0)
        continue;
      canvas.drawRect(idx_bin, y, 1, lp.track_height, style);
    }
  }
}

void GenomePlot::drawIdeogram(Canvas& canvas, const Chromosome& chr, double y) const {
  const layout::LayoutParams& lp = m_params.layout;
  ideogram::ChromosomeGlyph glyph = ideogram::resolveChromosome(chr, lp.scale);

  if (glyph.mode == ideogram::FLAT_BAR) {
    RectStyle bar;
    bar.fill = "#000000";
    canvas.drawRect(0, y, glyph.bar_width, lp.chromosome_bar_height, bar);
    return;
  }

  double radius = lp.cytoband_height * 0.25;
  for (auto const & arm : glyph.arms) {
    // 1. arm background and clip region
    RectStyle background;
    background.fill = "#FFFFFF";
    background.corner_radius = radius;
    canvas.drawRect(arm.x, y, arm.width, lp.cytoband_height, background);
    canvas.defineClipRect(arm.clip_id, arm.x, y, arm.width, lp.cytoband_height, radius);

    // 2. Giemsa bands
    for (auto const & fill : arm.bands) {
      RectStyle band;
      band.fill = CYTOBAND_COLOR;
      band.fill_opacity = fill.opacity;
      band.clip_id = arm.clip_id;
      canvas.drawRect(fill.x, y, fill.width, lp.cytoband_height, band);
      if (fill.hatch) {
        RectStyle hatch;
        hatch.pattern_id = HATCH_FILL_ID;
        hatch.clip_id = arm.clip_id;
        canvas.drawRect(fill.x, y, fill.width, lp.cytoband_height, hatch);
      }
    }

    // 3. arm outline
    RectStyle outline;
    outline.fill = "none";
    outline.stroke = "#000000";
    outline.stroke_width = 1;
    outline.corner_radius = radius;
    canvas.drawRect(arm.x, y, arm.width, lp.cytoband_height, outline);
  }
}

} // namespace draw
