#pragma once

#include <matricx/metrics/host_snapshot.h>

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace matricx {

// Sampling helper that tracks per-process CPU deltas across calls.
// Returns every process in enumeration order; ranking is the panel's job.
class ProcessSampler {
public:
  std::vector<ProcessRecord> sample();

private:
  bool hasPrev_ = false;
  std::uint64_t prevTotalJiffies_ = 0;
  std::unordered_map<int, std::uint64_t> prevProcJiffies_;
};

}  // namespace matricx
