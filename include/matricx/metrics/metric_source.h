#pragma once

#include <matricx/metrics/host_snapshot.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace matricx {

// Thrown by a metric source when a mandatory reading is unavailable.
class MetricError : public std::runtime_error {
public:
  explicit MetricError(const std::string& what) : std::runtime_error(what) {}
};

// Host metric facility. Each call is an independent query; gatherSnapshot()
// issues them concurrently, so an implementation must not share mutable
// state between different methods.
class IMetricSource {
public:
  virtual ~IMetricSource() = default;

  virtual CpuLoad currentLoad() = 0;
  virtual MemoryStats memory() = 0;
  virtual std::vector<NetInterfaceCounters> networkCounters() = 0;
  virtual std::vector<ProcessRecord> processList() = 0;
  virtual OsIdentity osIdentity() = 0;
  virtual double uptimeSeconds() = 0;
  virtual LoadAverage loadAverage() = 0;
  // May throw; callers treat failure as "no battery".
  virtual BatteryStatus batteryStatus() = 0;
};

}  // namespace matricx
