#ifndef CANVAS_H
#define CANVAS_H

#include <string>

/** Drawing surfaces for genome plots. */
namespace draw {

/** Horizontal text alignment relative to the anchor point. */
enum TextAnchor {
  ANCHOR_START,
  ANCHOR_MIDDLE,
  ANCHOR_END
};

/** Appearance of a rectangle. */
struct RectStyle
{
  std::string fill;         /** fill color, "none" for no fill */
  double fill_opacity;
  std::string pattern_id;   /** fill with a defined pattern instead of a color */
  std::string stroke;       /** stroke color, "none" for no stroke */
  double stroke_width;
  double corner_radius;
  std::string clip_id;      /** clip against a defined region */

  RectStyle();
};

/**
 * Receives the geometry of a genome plot.
 *
 * Coordinates inside a viewport are relative to its view box.
 */
class Canvas
{
public:
  virtual ~Canvas() {}

  /** Start a document of the given size. */
  virtual void begin(double width, double height) = 0;
  /** Finish the document. */
  virtual void end() = 0;

  /** Define a repeating stripe pattern usable as a fill. */
  virtual void defineHatchPattern (
    const std::string& id,
    double tile_size,
    double stripe_width,
    double angle,
    const std::string& color
  ) = 0;

  /** Open a nested viewport; drawing goes into it until endViewport(). */
  virtual void beginViewport (
    double x, double y, double width, double height,
    double vb_x, double vb_y, double vb_width, double vb_height
  ) = 0;
  virtual void endViewport() = 0;

  /** Define a (rounded) rectangular clip region. */
  virtual void defineClipRect (
    const std::string& id,
    double x, double y, double width, double height,
    double corner_radius
  ) = 0;

  virtual void drawRect (
    double x, double y, double width, double height,
    const RectStyle& style
  ) = 0;

  virtual void drawText (
    double x, double y,
    const std::string& text,
    TextAnchor anchor,
    double font_size,
    const std::string& font_family
  ) = 0;
};

} // namespace draw

#endif // CANVAS_H
