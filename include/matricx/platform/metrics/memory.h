#pragma once

#include <cstdint>
#include <istream>
#include <optional>

namespace matricx::platform {

struct MemoryInfo {
  std::uint64_t totalBytes = 0;
  std::uint64_t availableBytes = 0;
  std::uint64_t freeBytes = 0;
};

// Parses /proc/meminfo text. MemTotal and MemAvailable are required.
std::optional<MemoryInfo> parseMemInfo(std::istream& in);

std::optional<MemoryInfo> readMemoryInfo();

}  // namespace matricx::platform
