#include <matricx/tui/gauge.h>

#include <matricx/numeric.h>
#include <matricx/tui/format.h>

#include <algorithm>
#include <cmath>

namespace matricx {

namespace {

constexpr double kMiB = 1024.0 * 1024.0;

static std::string repeatGlyph(const char* glyph, int n) {
  std::string out;
  const std::string g(glyph);
  out.reserve(g.size() * static_cast<std::size_t>(std::max(0, n)));
  for (int i = 0; i < n; ++i) out += g;
  return out;
}

static int filledFor(double fraction, int width) {
  const double f = std::clamp(finiteOr(fraction), 0.0, 1.0);
  const int w = std::max(0, width);
  return std::clamp(static_cast<int>(std::lround(static_cast<double>(w) * f)), 0, w);
}

}  // namespace

GlyphSet glyphsFor(GlyphStyle style) {
  switch (style) {
    case GlyphStyle::Shaded:
      return {"\xE2\x96\x93", "\xE2\x96\x91"};  // ▓ ░
    case GlyphStyle::Ascii:
      return {"#", "-"};
    case GlyphStyle::Blocks:
    default:
      return {"\xE2\x96\x88", " "};  // █
  }
}

GaugeSpec::GaugeSpec(double f, int w, ColorClass c)
    : fraction(std::clamp(finiteOr(f), 0.0, 1.0)), width(std::max(0, w)), color(c) {}

int filledCells(const GaugeSpec& spec) {
  return filledFor(spec.fraction, spec.width);
}

std::string renderBar(const GaugeSpec& spec, GlyphStyle style) {
  const GlyphSet g = glyphsFor(style);
  const int filled = filledCells(spec);
  const int empty = spec.width - filled;

  std::string out;
  if (filled > 0) out = colorize(repeatGlyph(g.fill, filled), spec.color);
  out += repeatGlyph(g.empty, empty);
  return out;
}

std::string renderMiniBar(double fraction, int width, ColorClass color) {
  const int w = std::max(0, width);
  const int filled = filledFor(fraction, w);
  std::string out;
  if (filled > 0) out = colorize(std::string(static_cast<std::size_t>(filled), '|'), color);
  out.append(static_cast<std::size_t>(w - filled), ' ');
  return out;
}

std::string composeAlignedLine(const AlignedLine& line, int innerWidth, GlyphStyle style) {
  constexpr int kLeftPad = 1;
  constexpr int kMinGap = 1;

  const std::string labelText = line.label.empty() ? std::string() : line.label + " ";
  const int prefixLen = kLeftPad + static_cast<int>(displayWidth(labelText));
  const int readoutLen = static_cast<int>(displayWidth(line.readout));

  const int barWidth = std::max(0, innerWidth - prefixLen - readoutLen - kMinGap);
  const std::string bar = renderBar(GaugeSpec(line.fraction, barWidth, line.color), style);
  const int gap = std::max(kMinGap, innerWidth - prefixLen - barWidth - readoutLen);

  std::string out(static_cast<std::size_t>(kLeftPad), ' ');
  out += labelText;
  out += bar;
  out.append(static_cast<std::size_t>(gap), ' ');
  out += line.readout;
  return out;
}

std::string spaceEvenly(const std::vector<std::string>& items, int width) {
  if (items.empty()) return {};
  if (items.size() == 1) return items.front();

  int total = 0;
  for (const auto& item : items) total += static_cast<int>(displayWidth(item));
  const int gaps = static_cast<int>(items.size()) - 1;
  // Negative remainders all clamp to the one-space minimum.
  const int space = std::max(1, (width - total) / gaps);
  const std::string sep(static_cast<std::size_t>(space), ' ');

  std::string out = items.front();
  for (std::size_t i = 1; i < items.size(); ++i) {
    out += sep;
    out += items[i];
  }
  return out;
}

ColorClass pctColor(double pct) {
  const double p = finiteOr(pct);
  if (p >= 80.0) return ColorClass::Red;
  if (p >= 50.0) return ColorClass::Yellow;
  return ColorClass::Green;
}

ColorClass rateColor(double bytesPerSec) {
  const double mib = std::fabs(finiteOr(bytesPerSec)) / kMiB;
  if (mib >= 5.0) return ColorClass::Red;
  if (mib >= 1.0) return ColorClass::Yellow;
  return ColorClass::Green;
}

}  // namespace matricx
