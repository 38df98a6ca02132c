#include "SvgCanvas.hpp"
#include <boost/format.hpp>

using namespace std;
using boost::format;

namespace draw {

RectStyle::RectStyle()
: fill("#000000"),
  fill_opacity(1.0),
  stroke("none"),
  stroke_width(0.0),
  corner_radius(0.0)
{}

string escapeXml(const string& text) {
  string result;
  result.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':  result += "&amp;";  break;
      case '<':  result += "&lt;";   break;
      case '>':  result += "&gt;";   break;
      case '"':  result += "&quot;"; break;
      case '\'': result += "&apos;"; break;
      default:   result += c;
    }
  }
  return result;
}

string fmtNum(double value) {
  return str(format("%.10g") % value);
}

SvgCanvas::SvgCanvas(ostream& out) : m_out(out), m_depth(0) {}

void SvgCanvas::begin(double width, double height) {
  m_out << format("<svg width=\"%s\" height=\"%s\" version=\"1.1\" xmlns=\"http://www.w3.org/2000/svg\">\n")
           % fmtNum(width) % fmtNum(height);
  m_depth = 1;
}

void SvgCanvas::end() {
  while (m_depth > 0) {
    m_out << "</svg>\n";
    m_depth--;
  }
  m_out.flush();
}

void SvgCanvas::defineHatchPattern (
  const string& id,
  double tile_size,
  double stripe_width,
  double angle,
  const string& color
)
{
  m_out << "<defs>";
  m_out << format("<pattern id=\"%s\" width=\"%s\" height=\"%s\" patternUnits=\"userSpaceOnUse\" patternTransform=\"rotate(%s)\">")
           % escapeXml(id) % fmtNum(tile_size) % fmtNum(tile_size) % fmtNum(angle);
  m_out << format("<rect width=\"%s\" height=\"%s\" transform=\"translate(0,0)\" fill=\"%s\"/>")
           % fmtNum(stripe_width) % fmtNum(tile_size) % color;
  m_out << "</pattern></defs>\n";
}

void SvgCanvas::beginViewport (
  double x, double y, double width, double height,
  double vb_x, double vb_y, double vb_width, double vb_height
)
{
  m_out << format("<svg x=\"%s\" y=\"%s\" width=\"%s\" height=\"%s\" viewBox=\"%s %s %s %s\">\n")
           % fmtNum(x) % fmtNum(y) % fmtNum(width) % fmtNum(height)
           % fmtNum(vb_x) % fmtNum(vb_y) % fmtNum(vb_width) % fmtNum(vb_height);
  m_depth++;
}

void SvgCanvas::endViewport() {
  if (m_depth > 1) {
    m_out << "</svg>\n";
    m_depth--;
  }
}

void SvgCanvas::defineClipRect (
  const string& id,
  double x, double y, double width, double height,
  double corner_radius
)
{
  m_out << format("<clipPath id=\"%s\"><rect x=\"%s\" y=\"%s\" width=\"%s\" height=\"%s\" rx=\"%s\" ry=\"%s\"/></clipPath>\n")
           % escapeXml(id) % fmtNum(x) % fmtNum(y) % fmtNum(width) % fmtNum(height)
           % fmtNum(corner_radius) % fmtNum(corner_radius);
}

void SvgCanvas::drawRect (
  double x, double y, double width, double height,
  const RectStyle& style
)
{
  m_out << format("<rect x=\"%s\" y=\"%s\" width=\"%s\" height=\"%s\"")
           % fmtNum(x) % fmtNum(y) % fmtNum(width) % fmtNum(height);
  if (style.corner_radius > 0) {
    m_out << format(" rx=\"%s\" ry=\"%s\"") % fmtNum(style.corner_radius) % fmtNum(style.corner_radius);
  }
  if (!style.clip_id.empty()) {
    m_out << format(" clip-path=\"url(#%s)\"") % escapeXml(style.clip_id);
  }
  m_out << format(" stroke=\"%s\"") % style.stroke;
  if (style.stroke != "none") {
    m_out << format(" stroke-width=\"%s\"") % fmtNum(style.stroke_width);
  }
  if (!style.pattern_id.empty()) {
    m_out << format(" fill=\"url(#%s)\"") % escapeXml(style.pattern_id);
  } else {
    m_out << format(" fill=\"%s\"") % style.fill;
    if (style.fill_opacity < 1.0) {
      m_out << format(" fill-opacity=\"%s\"") % fmtNum(style.fill_opacity);
    }
  }
  m_out << "/>\n";
}

void SvgCanvas::drawText (
  double x, double y,
  const string& text,
  TextAnchor anchor,
  double font_size,
  const string& font_family
)
{
  const char* str_anchor = "start";
  if (anchor == ANCHOR_MIDDLE)
    str_anchor = "middle";
  else if (anchor == ANCHOR_END)
    str_anchor = "end";
  m_out << format("<text x=\"%s\" y=\"%s\" text-anchor=\"%s\" style=\"font-family: %s; font-size: %spx;\">%s</text>\n")
           % fmtNum(x) % fmtNum(y) % str_anchor % escapeXml(font_family) % fmtNum(font_size) % escapeXml(text);
}

} // namespace draw
