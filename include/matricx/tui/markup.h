#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace matricx {

enum class ColorClass {
  Default,
  Green,
  Yellow,
  Red,
  Cyan,
  Magenta,
  White,
};

// "red", "green", ... ; "default" for Default.
const char* colorClassName(ColorClass c);
std::optional<ColorClass> parseColorClass(std::string_view name);

// Wraps text in "{<color>-fg}...{/}". Default leaves the text untouched.
std::string colorize(std::string_view text, ColorClass color);

// Replaces '{' with "{open}" so untrusted text cannot open a tag.
std::string escapeMarkup(std::string_view text);

struct StyledRun {
  std::string text;
  ColorClass color = ColorClass::Default;
};

// Splits one markup line into runs of uniform color. "{/}" and "{/x-fg}"
// return to Default; "{open}" is a literal '{'; unknown tags are dropped.
// Adjacent runs of the same color are merged and empty runs are omitted.
std::vector<StyledRun> parseMarkup(std::string_view line);

}  // namespace matricx
