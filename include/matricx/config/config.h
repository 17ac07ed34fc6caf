#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace matricx {

enum class GlyphStyle {
  Blocks,  // █ filled, space empty
  Shaded,  // ▓ filled, ░ empty
  Ascii,   // # filled, - empty
};

struct Config {
  // Rendering
  GlyphStyle glyphStyle = GlyphStyle::Blocks;
  int miniBarWidth = 6;

  // Sampling
  std::uint32_t refreshMs = 1000;

  // Layout: first row of the process panel and rows kept for services+footer.
  int processTop = 15;
  int reservedBottomRows = 6;

  // Modes
  bool debug = false;
  bool jsonSnapshot = false;
  bool assumeYes = false;

  // Reads command-line flags on top of the defaults. Returns nullopt (and
  // fills *error when given) on an unusable value.
  static std::optional<Config> fromArgs(int argc, char** argv, std::string* error = nullptr);
};

std::optional<GlyphStyle> parseGlyphStyle(std::string v);
const char* glyphStyleToString(GlyphStyle v);

bool hasFlag(int argc, char** argv, std::string_view flag);
// Value of "--flag value" or "--flag=value".
std::optional<std::string_view> flagValue(int argc, char** argv, std::string_view flag);

}  // namespace matricx
