#include <matricx/tui/markup.h>

namespace matricx {

namespace {

struct ColorName {
  ColorClass color;
  std::string_view name;
};

constexpr ColorName kColorNames[] = {
    {ColorClass::Default, "default"},
    {ColorClass::Green, "green"},
    {ColorClass::Yellow, "yellow"},
    {ColorClass::Red, "red"},
    {ColorClass::Cyan, "cyan"},
    {ColorClass::Magenta, "magenta"},
    {ColorClass::White, "white"},
};

static bool isTagChar(char c) {
  return (c >= 'a' && c <= 'z') || c == '-' || c == '/';
}

static void appendRun(std::vector<StyledRun>& runs, std::string& pending, ColorClass color) {
  if (pending.empty()) return;
  if (!runs.empty() && runs.back().color == color) {
    runs.back().text += pending;
  } else {
    runs.push_back(StyledRun{pending, color});
  }
  pending.clear();
}

}  // namespace

const char* colorClassName(ColorClass c) {
  for (const auto& cn : kColorNames) {
    if (cn.color == c) return cn.name.data();
  }
  return "default";
}

std::optional<ColorClass> parseColorClass(std::string_view name) {
  for (const auto& cn : kColorNames) {
    if (cn.name == name) return cn.color;
  }
  return std::nullopt;
}

std::string colorize(std::string_view text, ColorClass color) {
  if (color == ColorClass::Default) return std::string(text);
  std::string out = "{";
  out += colorClassName(color);
  out += "-fg}";
  out += text;
  out += "{/}";
  return out;
}

std::string escapeMarkup(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c == '{') {
      out += "{open}";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::vector<StyledRun> parseMarkup(std::string_view line) {
  std::vector<StyledRun> runs;
  std::string pending;
  ColorClass current = ColorClass::Default;

  for (std::size_t i = 0; i < line.size();) {
    if (line[i] == '{') {
      std::size_t j = i + 1;
      while (j < line.size() && isTagChar(line[j])) ++j;
      if (j > i + 1 && j < line.size() && line[j] == '}') {
        const std::string_view tag = line.substr(i + 1, j - i - 1);
        if (tag == "open") {
          pending.push_back('{');
          i = j + 1;
          continue;
        }
        appendRun(runs, pending, current);
        if (tag.front() == '/') {
          current = ColorClass::Default;
        } else if (tag.size() > 3 && tag.substr(tag.size() - 3) == "-fg") {
          current = parseColorClass(tag.substr(0, tag.size() - 3)).value_or(current);
        }
        i = j + 1;
        continue;
      }
    }
    pending.push_back(line[i]);
    ++i;
  }
  appendRun(runs, pending, current);
  return runs;
}

}  // namespace matricx
