#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace matricx::platform {

struct CpuTimes {
  std::uint64_t idle = 0;
  std::uint64_t total = 0;
};

// Aggregate and per-core jiffy counters from one read of /proc/stat.
struct CpuStat {
  CpuTimes aggregate;
  std::vector<CpuTimes> perCore;
};

std::optional<CpuStat> readCpuStat();

}  // namespace matricx::platform
