#include <matricx/config/config.h>

#include <cctype>
#include <string>

namespace matricx {

std::optional<GlyphStyle> parseGlyphStyle(std::string v) {
  for (char& c : v) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (v == "blocks" || v == "block" || v == "solid" || v == "classic") return GlyphStyle::Blocks;
  if (v == "shaded" || v == "shade" || v == "shadow") return GlyphStyle::Shaded;
  if (v == "ascii" || v == "plain" || v == "text") return GlyphStyle::Ascii;
  return std::nullopt;
}

const char* glyphStyleToString(GlyphStyle v) {
  switch (v) {
    case GlyphStyle::Shaded:
      return "shaded";
    case GlyphStyle::Ascii:
      return "ascii";
    case GlyphStyle::Blocks:
    default:
      return "blocks";
  }
}

bool hasFlag(int argc, char** argv, std::string_view flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] && std::string_view(argv[i]) == flag) return true;
  }
  return false;
}

std::optional<std::string_view> flagValue(int argc, char** argv, std::string_view flag) {
  for (int i = 1; i < argc; ++i) {
    if (!argv[i]) continue;
    const std::string_view a(argv[i]);
    if (a == flag) {
      if (i + 1 < argc && argv[i + 1]) return std::string_view(argv[i + 1]);
      return std::nullopt;
    }
    if (a.rfind(flag, 0) == 0 && a.size() > flag.size() && a[flag.size()] == '=') {
      return a.substr(flag.size() + 1);
    }
  }
  return std::nullopt;
}

std::optional<Config> Config::fromArgs(int argc, char** argv, std::string* error) {
  Config cfg;
  cfg.debug = hasFlag(argc, argv, "--debug");
  cfg.jsonSnapshot = hasFlag(argc, argv, "--json");
  cfg.assumeYes = hasFlag(argc, argv, "--yes") || hasFlag(argc, argv, "-y");

  if (hasFlag(argc, argv, "--style") || flagValue(argc, argv, "--style")) {
    const auto value = flagValue(argc, argv, "--style");
    const auto style = value ? parseGlyphStyle(std::string(*value)) : std::nullopt;
    if (!style) {
      if (error) {
        *error = value ? "invalid --style '" + std::string(*value) + "' (expected blocks, shaded or ascii)"
                       : std::string("--style requires a value (blocks, shaded or ascii)");
      }
      return std::nullopt;
    }
    cfg.glyphStyle = *style;
  }

  return cfg;
}

}  // namespace matricx
