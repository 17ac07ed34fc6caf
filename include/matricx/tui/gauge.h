#pragma once

#include <matricx/config/config.h>
#include <matricx/tui/markup.h>

#include <string>
#include <vector>

namespace matricx {

struct GlyphSet {
  const char* fill;
  const char* empty;
};

GlyphSet glyphsFor(GlyphStyle style);

// fraction is coerced to finite and clamped to [0, 1]; width to >= 0.
struct GaugeSpec {
  GaugeSpec(double fraction, int width, ColorClass color);

  double fraction = 0.0;
  int width = 0;
  ColorClass color = ColorClass::Green;
};

// Number of filled cells: round(width * fraction) within [0, width].
int filledCells(const GaugeSpec& spec);

// Exactly spec.width visible columns; only the filled run carries color.
std::string renderBar(const GaugeSpec& spec, GlyphStyle style = GlyphStyle::Blocks);

// '|' fill, space empty.
std::string renderMiniBar(double fraction, int width = 6, ColorClass color = ColorClass::Green);

struct AlignedLine {
  std::string label;  // empty: no label column
  double fraction = 0.0;
  std::string readout;
  ColorClass color = ColorClass::Green;
};

// " <label> <bar><gap><readout>", flush to innerWidth whenever the width
// leaves room for the prefix, readout and a one-column gap.
std::string composeAlignedLine(const AlignedLine& line, int innerWidth, GlyphStyle style = GlyphStyle::Blocks);

// Joins items with floor((width - visible total) / (count - 1)) spaces, at
// least one.
std::string spaceEvenly(const std::vector<std::string>& items, int width);

// >= 80 red, >= 50 yellow, otherwise green.
ColorClass pctColor(double pct);

// >= 5 MiB/s red, >= 1 MiB/s yellow, otherwise green. Sign is ignored.
ColorClass rateColor(double bytesPerSec);

}  // namespace matricx
