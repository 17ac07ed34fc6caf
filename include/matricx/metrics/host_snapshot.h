#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace matricx {

struct CpuLoad {
  // Percent (0..100).
  double total = 0.0;
  std::vector<double> perCore;
};

struct MemoryStats {
  std::uint64_t totalBytes = 0;
  std::uint64_t usedBytes = 0;
  // 0 when the source does not distinguish active memory.
  std::uint64_t activeBytes = 0;
};

struct NetInterfaceCounters {
  std::string name;
  double rxBytes = 0.0;
  double txBytes = 0.0;
  // Instantaneous rates when the source reports them directly (bytes/sec).
  std::optional<double> rxRate;
  std::optional<double> txRate;
};

struct ProcessRecord {
  std::string name;
  int pid = 0;
  double cpuPercent = 0.0;
  double residentBytes = 0.0;
};

struct OsIdentity {
  std::string distro;
  std::string release;
  std::string kernel;
};

struct LoadAverage {
  double one = 0.0;
  double five = 0.0;
  double fifteen = 0.0;
};

struct BatteryStatus {
  bool present = false;
  double percent = 0.0;
};

// Raw metrics fetched once per tick. Built by gatherSnapshot() and treated
// as read-only afterwards.
struct HostSnapshot {
  CpuLoad cpu;
  MemoryStats memory;
  std::vector<NetInterfaceCounters> interfaces;
  std::vector<ProcessRecord> processes;
  OsIdentity os;
  double uptimeSeconds = 0.0;
  LoadAverage load;
  BatteryStatus battery;
  std::chrono::steady_clock::time_point sampledAt{};
};

}  // namespace matricx
