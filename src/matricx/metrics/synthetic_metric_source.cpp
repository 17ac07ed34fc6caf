#include <matricx/metrics/synthetic_metric_source.h>

#include <algorithm>
#include <array>
#include <string>

namespace matricx {

namespace {

constexpr std::uint64_t kSyntheticMemTotal = 16ull * 1024ull * 1024ull * 1024ull;

struct FakeProcess {
  const char* name;
  int pid;
  double rssBytes;
};

constexpr std::array<FakeProcess, 10> kFakeProcesses = {{
    {"systemd", 1, 12.0e6},
    {"dockerd", 812, 95.0e6},
    {"containerd", 790, 48.0e6},
    {"postgres: checkpointer", 1204, 22.0e6},
    {"redis-server *:6379", 1311, 9.5e6},
    {"nginx: worker process", 1422, 6.1e6},
    {"code --type=renderer --enable-crash-reporter", 4031, 412.0e6},
    {"firefox", 4410, 780.0e6},
    {"bash", 5120, 4.2e6},
    {"matricx", 6001, 11.0e6},
}};

static std::mt19937::result_type clockSeed() {
  return static_cast<std::mt19937::result_type>(
      std::chrono::high_resolution_clock::now().time_since_epoch().count());
}

}  // namespace

RandomWalk::RandomWalk(double lo, double hi, double stddev, std::mt19937::result_type seed)
    : rng_(seed), step_(0.0, stddev), lo_(lo), hi_(hi) {}

double RandomWalk::next() {
  if (!initialized_) {
    std::uniform_real_distribution<double> initDist(lo_, hi_);
    value_ = initDist(rng_);
    initialized_ = true;
  } else {
    value_ = std::clamp(value_ + step_(rng_), lo_, hi_);
  }
  return value_;
}

SyntheticMetricSource::SyntheticMetricSource(unsigned coreCount)
    : memPct_(10.0, 95.0, 2.0, clockSeed() + 101),
      rxRate_(0.0, 8.0 * 1024.0 * 1024.0, 400.0 * 1024.0, clockSeed() + 102),
      txRate_(0.0, 3.0 * 1024.0 * 1024.0, 150.0 * 1024.0, clockSeed() + 103),
      load_(0.0, 8.0, 0.3, clockSeed() + 104),
      start_(std::chrono::steady_clock::now()) {
  const auto base = clockSeed();
  cores_.reserve(coreCount);
  for (unsigned i = 0; i < coreCount; ++i) {
    cores_.emplace_back(0.0, 100.0, 12.0, base + i);
  }
  procCpu_.reserve(kFakeProcesses.size());
  for (std::size_t i = 0; i < kFakeProcesses.size(); ++i) {
    procCpu_.emplace_back(0.0, 40.0, 4.0, base + 1000 + static_cast<unsigned>(i));
  }
}

CpuLoad SyntheticMetricSource::currentLoad() {
  CpuLoad load;
  load.perCore.reserve(cores_.size());
  double sum = 0.0;
  for (auto& c : cores_) {
    const double v = c.next();
    load.perCore.push_back(v);
    sum += v;
  }
  load.total = cores_.empty() ? 0.0 : sum / static_cast<double>(cores_.size());
  return load;
}

MemoryStats SyntheticMetricSource::memory() {
  const double pct = memPct_.next();
  MemoryStats out;
  out.totalBytes = kSyntheticMemTotal;
  out.usedBytes = static_cast<std::uint64_t>(static_cast<double>(kSyntheticMemTotal) * pct / 100.0);
  out.activeBytes = out.usedBytes;
  return out;
}

std::vector<NetInterfaceCounters> SyntheticMetricSource::networkCounters() {
  const double rx = rxRate_.next();
  const double tx = txRate_.next();
  rxTotal_ += rx;
  txTotal_ += tx;

  NetInterfaceCounters eth;
  eth.name = "eth0";
  eth.rxBytes = rxTotal_;
  eth.txBytes = txTotal_;
  eth.rxRate = rx;
  eth.txRate = tx;
  return {eth};
}

std::vector<ProcessRecord> SyntheticMetricSource::processList() {
  std::vector<ProcessRecord> out;
  out.reserve(kFakeProcesses.size());
  for (std::size_t i = 0; i < kFakeProcesses.size(); ++i) {
    const auto& p = kFakeProcesses[i];
    out.push_back(ProcessRecord{p.name, p.pid, procCpu_[i].next(), p.rssBytes});
  }
  return out;
}

OsIdentity SyntheticMetricSource::osIdentity() {
  return OsIdentity{"Debug Linux", "1.0", "6.0.0-debug"};
}

double SyntheticMetricSource::uptimeSeconds() {
  const auto elapsed = std::chrono::steady_clock::now() - start_;
  return 3.0 * 86400.0 + 4.0 * 3600.0 + std::chrono::duration<double>(elapsed).count();
}

LoadAverage SyntheticMetricSource::loadAverage() {
  const double v = load_.next();
  return LoadAverage{v, v * 0.9, v * 0.8};
}

BatteryStatus SyntheticMetricSource::batteryStatus() {
  return BatteryStatus{true, 87.0};
}

}  // namespace matricx
