#include <matricx/tui/format.h>

#include <matricx/numeric.h>

#include <array>
#include <cstdio>
#include <cstdlib>

namespace matricx {

namespace {

constexpr std::array<const char*, 9> kUnits = {"B", "kB", "MB", "GB", "TB", "PB", "EB", "ZB", "YB"};

static bool isContinuationByte(unsigned char c) {
  return (c & 0xC0) == 0x80;
}

constexpr std::string_view kOpenBraceTag = "{open}";

static bool isTagChar(char c) {
  return (c >= 'a' && c <= 'z') || c == '-' || c == '/';
}

// Length of a markup tag starting at s[i], 0 when s[i] does not open one.
static std::size_t tagLengthAt(std::string_view s, std::size_t i) {
  if (s[i] != '{') return 0;
  std::size_t j = i + 1;
  while (j < s.size() && isTagChar(s[j])) ++j;
  if (j == i + 1 || j >= s.size() || s[j] != '}') return 0;
  return j - i + 1;
}

// Byte offset of the code point with index cp (or s.size()).
static std::size_t byteOffsetOf(std::string_view s, std::size_t cp) {
  std::size_t seen = 0;
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (isContinuationByte(static_cast<unsigned char>(s[i]))) continue;
    if (seen == cp) return i;
    ++seen;
  }
  return s.size();
}

static std::string shortestNumber(double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.12g", v);
  return buf;
}

}  // namespace

std::string humanizeBytes(double bytes) {
  double v = finiteOr(bytes);
  std::string sign;
  if (v < 0) {
    sign = "-";
    v = -v;
  }

  if (v < 1.0) return sign + shortestNumber(v) + " B";

  std::size_t exponent = 0;
  while (v >= 1000.0 && exponent + 1 < kUnits.size()) {
    v /= 1000.0;
    ++exponent;
  }

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.3g", v);
  const double rounded = std::strtod(buf, nullptr);
  return sign + shortestNumber(rounded) + " " + kUnits[exponent];
}

std::string truncateMiddle(std::string_view s, std::size_t maxLen) {
  const std::size_t len = codePointCount(s);
  if (len <= maxLen) return std::string(s);
  if (maxLen <= 3) return takeCodePoints(s, maxLen);

  const std::size_t keep = maxLen - 3;
  const std::size_t head = (keep + 1) / 2;
  const std::size_t tail = keep / 2;

  std::string out(s.substr(0, byteOffsetOf(s, head)));
  out += "...";
  out += s.substr(byteOffsetOf(s, len - tail));
  return out;
}

std::string takeCodePoints(std::string_view s, std::size_t n) {
  return std::string(s.substr(0, byteOffsetOf(s, n)));
}

std::string stripTags(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size();) {
    if (const std::size_t t = tagLengthAt(s, i)) {
      if (s.substr(i, t) == kOpenBraceTag) out.push_back('{');
      i += t;
      continue;
    }
    out.push_back(s[i]);
    ++i;
  }
  return out;
}

std::string clipVisible(std::string_view s, std::size_t width) {
  std::string out;
  std::size_t visible = 0;
  for (std::size_t i = 0; i < s.size();) {
    if (const std::size_t t = tagLengthAt(s, i)) {
      const bool literal = s.substr(i, t) == kOpenBraceTag;
      if (literal && visible == width) break;
      out.append(s.substr(i, t));
      if (literal) ++visible;
      i += t;
      continue;
    }
    const bool lead = !isContinuationByte(static_cast<unsigned char>(s[i]));
    if (lead && visible == width) break;
    out.push_back(s[i]);
    if (lead) ++visible;
    ++i;
  }
  return out;
}

std::size_t codePointCount(std::string_view s) {
  std::size_t n = 0;
  for (char c : s) {
    if (!isContinuationByte(static_cast<unsigned char>(c))) ++n;
  }
  return n;
}

std::size_t displayWidth(std::string_view s) {
  return codePointCount(stripTags(s));
}

std::string padRight(std::string_view s, std::size_t width) {
  std::string out(s);
  const std::size_t w = displayWidth(s);
  if (w < width) out.append(width - w, ' ');
  return out;
}

std::string padLeft(std::string_view s, std::size_t width, char fill) {
  const std::size_t w = displayWidth(s);
  std::string out;
  if (w < width) out.append(width - w, fill);
  out += s;
  return out;
}

std::string fmtFixed(double v, int decimals) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, finiteOr(v));
  return buf;
}

}  // namespace matricx
