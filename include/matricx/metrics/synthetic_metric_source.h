#pragma once

#include <matricx/metrics/metric_source.h>

#include <chrono>
#include <random>
#include <vector>

namespace matricx {

// Bounded random walk; the first value is drawn uniformly from [lo, hi].
class RandomWalk {
public:
  RandomWalk(double lo, double hi, double stddev, std::mt19937::result_type seed);

  double next();

private:
  std::mt19937 rng_;
  std::normal_distribution<double> step_;
  double lo_;
  double hi_;
  double value_ = 0.0;
  bool initialized_ = false;
};

// Synthetic host used by --debug: plausible, moving numbers without touching
// the real system.
class SyntheticMetricSource final : public IMetricSource {
public:
  explicit SyntheticMetricSource(unsigned coreCount = 8);

  CpuLoad currentLoad() override;
  MemoryStats memory() override;
  std::vector<NetInterfaceCounters> networkCounters() override;
  std::vector<ProcessRecord> processList() override;
  OsIdentity osIdentity() override;
  double uptimeSeconds() override;
  LoadAverage loadAverage() override;
  BatteryStatus batteryStatus() override;

private:
  std::vector<RandomWalk> cores_;
  RandomWalk memPct_;
  RandomWalk rxRate_;
  RandomWalk txRate_;
  RandomWalk load_;
  std::vector<RandomWalk> procCpu_;
  double rxTotal_ = 0.0;
  double txTotal_ = 0.0;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace matricx
