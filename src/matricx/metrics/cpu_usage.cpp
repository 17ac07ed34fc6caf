#include <matricx/metrics/cpu_usage.h>

#include <matricx/platform/metrics/cpu.h>

#include <algorithm>

namespace matricx {

double busyPercent(std::uint64_t idleDelta, std::uint64_t totalDelta) {
  if (totalDelta == 0) return 0.0;
  const double idleFrac = static_cast<double>(std::min(idleDelta, totalDelta)) / static_cast<double>(totalDelta);
  return 100.0 * (1.0 - idleFrac);
}

std::optional<CpuLoad> CpuLoadCollector::sample() {
  const auto stat = platform::readCpuStat();
  if (!stat) return std::nullopt;

  CpuLoad load;
  {
    const std::uint64_t idle = stat->aggregate.idle;
    const std::uint64_t total = stat->aggregate.total;
    const std::uint64_t idleDelta = (idle >= prevIdle_) ? idle - prevIdle_ : 0;
    const std::uint64_t totalDelta = (total >= prevTotal_) ? total - prevTotal_ : 0;
    load.total = busyPercent(idleDelta, totalDelta);
    prevIdle_ = idle;
    prevTotal_ = total;
  }

  // Core hotplug changes the count; restart the per-core baseline.
  if (prevCoreIdle_.size() != stat->perCore.size()) {
    prevCoreIdle_.assign(stat->perCore.size(), 0);
    prevCoreTotal_.assign(stat->perCore.size(), 0);
  }

  load.perCore.reserve(stat->perCore.size());
  for (std::size_t i = 0; i < stat->perCore.size(); ++i) {
    const auto& t = stat->perCore[i];
    const std::uint64_t idleDelta = (t.idle >= prevCoreIdle_[i]) ? t.idle - prevCoreIdle_[i] : 0;
    const std::uint64_t totalDelta = (t.total >= prevCoreTotal_[i]) ? t.total - prevCoreTotal_[i] : 0;
    load.perCore.push_back(busyPercent(idleDelta, totalDelta));
    prevCoreIdle_[i] = t.idle;
    prevCoreTotal_[i] = t.total;
  }

  return load;
}

}  // namespace matricx
