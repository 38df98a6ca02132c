#include "LayoutCalculator.hpp"
#include <algorithm> // max()

using namespace std;
using seqio::Chromosome;

namespace layout {

double ApproxTextMetrics::getTextWidth(const string& text, double text_size) const {
  return text.length() * TEXT_RATIO * text_size;
}

LayoutParams::LayoutParams()
: scale(100000),
  text_size(16),
  text_gap(10),
  horizontal_gap(50),
  track_height(5),
  in_gap(2),
  cytoband_height(10),
  chromosome_bar_height(1),
  gap(15),
  two_column(false)
{}

LayoutResult::LayoutResult()
: width(0),
  height(0),
  entry_height(0),
  num_tracks(0),
  draw_cytobands(false)
{}

double calcEntryHeight(size_t num_tracks, bool draw_cytobands, const LayoutParams& params) {
  return num_tracks * (params.track_height + params.in_gap) +
    (draw_cytobands ? params.cytoband_height : params.chromosome_bar_height);
}

LayoutResult calcLayout (
  const TStackSet& stacks,
  size_t num_tracks,
  bool draw_cytobands,
  const LayoutParams& params,
  const TextMetrics& metrics
)
{
  LayoutResult result;
  result.num_tracks = num_tracks;
  result.draw_cytobands = draw_cytobands;
  result.label_width = vector<double>(params.two_column ? 2 : 1, 0.0);

  // widths
  double max_internal_width = 0.0;
  for (auto const & stack : stacks) {
    double internal_width = 0.0;
    for (size_t col=0; col<stack.size(); ++col) {
      const Chromosome& chr = *stack[col];
      if (col >= result.label_width.size())
        result.label_width.resize(col+1, 0.0);
      double text_width = metrics.getTextWidth(chr.id, params.text_size);
      result.label_width[col] = max(result.label_width[col], text_width);
      internal_width += static_cast<double>(chr.length) / params.scale;
      if (col > 0)
        internal_width += params.horizontal_gap;
    }
    max_internal_width = max(max_internal_width, internal_width);
  }
  result.width = max_internal_width + params.text_gap + result.label_width[0] + 2*BORDER_GAP;
  if (params.two_column && result.label_width.size() > 1 && result.label_width[1] > 0) {
    result.width += params.text_gap + result.label_width[1] + 2*BORDER_GAP;
  }

  // heights
  result.entry_height = calcEntryHeight(num_tracks, draw_cytobands, params);
  if (!stacks.empty()) {
    result.height = stacks.size() * (result.entry_height + 2*BORDER_GAP + params.gap) - params.gap;
  }

  return result;
}

LayoutResult calcLayout (
  const TStackSet& stacks,
  size_t num_tracks,
  bool draw_cytobands,
  const LayoutParams& params
)
{
  ApproxTextMetrics metrics;
  return calcLayout(stacks, num_tracks, draw_cytobands, params, metrics);
}

EntryPlacement placeEntry (
  const LayoutResult& layout,
  const LayoutParams& params,
  const Chromosome& chromosome,
  size_t stack_idx,
  size_t col_idx
)
{
  EntryPlacement p;
  double label_width = col_idx < layout.label_width.size() ? layout.label_width[col_idx] : 0.0;
  p.raster_width = static_cast<double>(chromosome.length) / params.scale + 1;
  p.width = p.raster_width + 2*BORDER_GAP;
  p.height = layout.entry_height + 2*BORDER_GAP;
  p.y = stack_idx * (layout.entry_height + 2*BORDER_GAP + params.gap);
  p.chromosome_y = layout.entry_height -
    (layout.draw_cytobands ? params.cytoband_height : params.chromosome_bar_height);
  p.label_y = p.y + layout.entry_height / 2 + params.text_size / 2;
  if (col_idx == 0) {
    p.x = label_width + params.text_gap;
    p.label_x = label_width;
    p.label_anchor_end = true;
  } else {
    p.x = layout.width - label_width - params.text_gap - p.width;
    p.label_x = layout.width - label_width;
    p.label_anchor_end = false;
  }
  return p;
}

} // namespace layout
