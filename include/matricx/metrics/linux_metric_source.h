#pragma once

#include <matricx/metrics/cpu_usage.h>
#include <matricx/metrics/metric_source.h>
#include <matricx/metrics/process_list.h>
#include <matricx/platform/metrics/memory.h>

namespace matricx {

// used = total - MemFree (page cache included); active = total - MemAvailable.
MemoryStats memoryStatsFromInfo(const platform::MemoryInfo& info);

// procfs/sysfs backed metric source.
class LinuxMetricSource final : public IMetricSource {
public:
  CpuLoad currentLoad() override;
  MemoryStats memory() override;
  std::vector<NetInterfaceCounters> networkCounters() override;
  std::vector<ProcessRecord> processList() override;
  OsIdentity osIdentity() override;
  double uptimeSeconds() override;
  LoadAverage loadAverage() override;
  BatteryStatus batteryStatus() override;

private:
  CpuLoadCollector cpu_;
  ProcessSampler processes_;
};

}  // namespace matricx
