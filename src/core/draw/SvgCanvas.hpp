#ifndef SVGCANVAS_H
#define SVGCANVAS_H

#include "Canvas.hpp"
#include <ostream>
#include <string>

namespace draw {

/** Writes a plot as a standalone SVG document. */
class SvgCanvas : public Canvas
{
public:
  explicit SvgCanvas(std::ostream& out);

  void begin(double width, double height);
  void end();
  void defineHatchPattern (
    const std::string& id,
    double tile_size,
    double stripe_width,
    double angle,
    const std::string& color
  );
  void beginViewport (
    double x, double y, double width, double height,
    double vb_x, double vb_y, double vb_width, double vb_height
  );
  void endViewport();
  void defineClipRect (
    const std::string& id,
    double x, double y, double width, double height,
    double corner_radius
  );
  void drawRect (
    double x, double y, double width, double height,
    const RectStyle& style
  );
  void drawText (
    double x, double y,
    const std::string& text,
    TextAnchor anchor,
    double font_size,
    const std::string& font_family
  );

private:
  std::ostream& m_out;
  int m_depth;
};

/** Escape XML special characters. */
std::string escapeXml(const std::string& text);
/** Format a coordinate without trailing zeros. */
std::string fmtNum(double value);

} // namespace draw

#endif // SVGCANVAS_H
