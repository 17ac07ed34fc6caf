#pragma once

#include <matricx/metrics/metric_source.h>

#include <atomic>
#include <string>
#include <vector>

namespace matricx::testing {

// Scriptable in-memory source. Network counters advance by fixed steps on
// every call.
class FakeMetricSource final : public IMetricSource {
public:
  std::atomic<bool> failMemory{false};
  std::atomic<bool> failBattery{false};
  double rxStep = 1000.0;
  double txStep = 500.0;

  CpuLoad currentLoad() override { return CpuLoad{25.0, {10.0, 20.0, 30.0, 40.0}}; }

  MemoryStats memory() override {
    if (failMemory) throw MetricError("memory source offline");
    return MemoryStats{16000000000ull, 12000000000ull, 8000000000ull};
  }

  std::vector<NetInterfaceCounters> networkCounters() override {
    rx_ += rxStep;
    tx_ += txStep;
    NetInterfaceCounters eth;
    eth.name = "eth0";
    eth.rxBytes = rx_;
    eth.txBytes = tx_;
    return {eth};
  }

  std::vector<ProcessRecord> processList() override {
    return {
        {"bash", 100, 0.5, 4.0e6},
        {"mongod", 200, 3.5, 300.0e6},
        {"nginx: master", 300, 0.0, 8.0e6},
    };
  }

  OsIdentity osIdentity() override { return OsIdentity{"Testix", "1.0", "6.1.0-test"}; }
  double uptimeSeconds() override { return 90061.0; }
  LoadAverage loadAverage() override { return LoadAverage{0.1, 0.2, 0.3}; }

  BatteryStatus batteryStatus() override {
    if (failBattery) throw MetricError("no power supply class");
    return BatteryStatus{true, 55.0};
  }

private:
  double rx_ = 0.0;
  double tx_ = 0.0;
};

}  // namespace matricx::testing
