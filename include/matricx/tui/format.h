#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace matricx {

// SI (base 1000) byte size with 3 significant digits: "0 B", "512 B",
// "1.05 MB", "16 GB". Negative input keeps its sign; non-finite counts as 0.
std::string humanizeBytes(double bytes);

// Keeps the head and tail around "..." so the result is exactly maxLen code
// points. Strings that already fit are returned unchanged; maxLen <= 3 cuts.
std::string truncateMiddle(std::string_view s, std::size_t maxLen);

// First n code points of s.
std::string takeCodePoints(std::string_view s, std::size_t n);

// Removes {xxx} color tags; "{open}" becomes a literal '{'.
std::string stripTags(std::string_view s);

// Cuts a markup line after `width` visible code points. Tags are kept whole.
std::string clipVisible(std::string_view s, std::size_t width);

// Visible columns: UTF-8 code points after tag removal.
std::size_t displayWidth(std::string_view s);

// Code points in a UTF-8 string (tags not stripped).
std::size_t codePointCount(std::string_view s);

std::string padRight(std::string_view s, std::size_t width);
std::string padLeft(std::string_view s, std::size_t width, char fill = ' ');

std::string fmtFixed(double v, int decimals);

}  // namespace matricx
