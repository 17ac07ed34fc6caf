#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace matricx::platform {

using ProcessId = std::uint32_t;

struct ProcessInfo {
  ProcessId pid = 0;
  std::string name;
  std::uint64_t cpuJiffies = 0;
  std::uint64_t memoryBytes = 0;
};

// All processes visible under /proc, in directory order.
std::vector<ProcessInfo> enumerateProcesses();
std::optional<std::uint64_t> readTotalCpuJiffies();

}  // namespace matricx::platform
