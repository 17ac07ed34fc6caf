#pragma once

#include <matricx/metrics/host_snapshot.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace matricx {

// Busy percentage from jiffy deltas between calls. The first call measures
// against boot (all-zero previous counters).
class CpuLoadCollector {
public:
  std::optional<CpuLoad> sample();

private:
  std::uint64_t prevIdle_ = 0;
  std::uint64_t prevTotal_ = 0;
  std::vector<std::uint64_t> prevCoreIdle_;
  std::vector<std::uint64_t> prevCoreTotal_;
};

// Busy percentage for one idle/total delta pair; 0 when no time elapsed.
double busyPercent(std::uint64_t idleDelta, std::uint64_t totalDelta);

}  // namespace matricx
