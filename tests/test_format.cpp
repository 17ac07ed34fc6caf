#include <matricx/tui/format.h>

#include "test_framework.h"

#include <limits>
#include <string>

using namespace matricx;

TEST_CASE("humanizeBytes uses SI units with three significant digits") {
  REQUIRE(humanizeBytes(0) == "0 B");
  REQUIRE(humanizeBytes(512) == "512 B");
  REQUIRE(humanizeBytes(1000) == "1 kB");
  REQUIRE(humanizeBytes(1048576) == "1.05 MB");
  REQUIRE(humanizeBytes(5242880) == "5.24 MB");
  REQUIRE(humanizeBytes(16000000000.0) == "16 GB");
}

TEST_CASE("humanizeBytes keeps the sign and ignores non-finite input") {
  REQUIRE(humanizeBytes(-2048) == "-2.05 kB");
  REQUIRE(humanizeBytes(std::numeric_limits<double>::quiet_NaN()) == "0 B");
  REQUIRE(humanizeBytes(std::numeric_limits<double>::infinity()) == "0 B");
}

TEST_CASE("truncateMiddle produces exactly maxLen and keeps head and tail") {
  const std::string s = "abcdefghijklmnopqrstuvwxyz";
  for (std::size_t maxLen = 4; maxLen < s.size(); ++maxLen) {
    const std::string t = truncateMiddle(s, maxLen);
    REQUIRE(t.size() == maxLen);
    const std::size_t keep = (maxLen - 3) / 2;
    REQUIRE(t.compare(0, keep, s, 0, keep) == 0);
    REQUIRE(t.compare(t.size() - keep, keep, s, s.size() - keep, keep) == 0);
    REQUIRE(t.find("...") != std::string::npos);
  }
  REQUIRE(truncateMiddle("abcdefghij", 7) == "ab...ij");
  REQUIRE(truncateMiddle("abcdefghij", 8) == "abc...ij");
}

TEST_CASE("truncateMiddle leaves short strings alone and slices tiny widths") {
  REQUIRE(truncateMiddle("short", 10) == "short");
  REQUIRE(truncateMiddle("short", 5) == "short");
  REQUIRE(truncateMiddle("abcdef", 3) == "abc");
  REQUIRE(truncateMiddle("abcdef", 0).empty());
}

TEST_CASE("truncateMiddle counts code points, not bytes") {
  // Each box glyph is three bytes in UTF-8.
  const std::string s = "\xE2\x96\x88\xE2\x96\x88\xE2\x96\x88\xE2\x96\x88\xE2\x96\x88\xE2\x96\x88\xE2\x96\x88\xE2\x96\x88";
  const std::string t = truncateMiddle(s, 5);
  REQUIRE(codePointCount(t) == 5);
}

TEST_CASE("stripTags and displayWidth ignore color markup") {
  REQUIRE(stripTags("{red-fg}hot{/} cold") == "hot cold");
  REQUIRE(stripTags("no tags {here") == "no tags {here");
  REQUIRE(displayWidth("{green-fg}\xE2\x96\x88\xE2\x96\x88{/}  ") == 4);
  REQUIRE(displayWidth("") == 0);
}

TEST_CASE("clipVisible cuts by visible width and keeps tags whole") {
  REQUIRE(clipVisible("abcdef", 4) == "abcd");
  REQUIRE(clipVisible("{red-fg}abc{/}def", 2) == "{red-fg}ab");
  REQUIRE(clipVisible("{red-fg}abc{/}def", 3) == "{red-fg}abc{/}");
  REQUIRE(clipVisible("a{open}b", 2) == "a{open}");
  REQUIRE(clipVisible("\xE2\x96\x88\xE2\x96\x88x", 1) == "\xE2\x96\x88");
  REQUIRE(clipVisible("short", 10) == "short");
}

TEST_CASE("{open} counts as one literal brace") {
  REQUIRE(stripTags("{open}red-fg}x") == "{red-fg}x");
  REQUIRE(displayWidth("{open}/}") == 2);
}

TEST_CASE("padding helpers pad by visible width") {
  REQUIRE(padLeft("7", 2, '0') == "07");
  REQUIRE(padLeft("123", 2, '0') == "123");
  REQUIRE(padRight("ab", 4) == "ab  ");
  REQUIRE(padRight("{red-fg}ab{/}", 3) == "{red-fg}ab{/} ");
  REQUIRE(fmtFixed(49.96, 1) == "50.0");
  REQUIRE(fmtFixed(std::numeric_limits<double>::quiet_NaN(), 2) == "0.00");
}
