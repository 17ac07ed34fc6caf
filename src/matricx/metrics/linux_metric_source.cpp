#include <matricx/metrics/linux_metric_source.h>

#include <matricx/platform/metrics/memory.h>
#include <matricx/platform/metrics/network.h>
#include <matricx/platform/metrics/system.h>

namespace matricx {

MemoryStats memoryStatsFromInfo(const platform::MemoryInfo& info) {
  MemoryStats out;
  out.totalBytes = info.totalBytes;
  out.usedBytes = (info.totalBytes > info.freeBytes) ? (info.totalBytes - info.freeBytes) : 0;
  out.activeBytes = (info.totalBytes > info.availableBytes) ? (info.totalBytes - info.availableBytes) : 0;
  return out;
}

CpuLoad LinuxMetricSource::currentLoad() {
  auto load = cpu_.sample();
  if (!load) throw MetricError("cpu load unavailable (/proc/stat)");
  return std::move(*load);
}

MemoryStats LinuxMetricSource::memory() {
  const auto info = platform::readMemoryInfo();
  if (!info) throw MetricError("memory info unavailable (/proc/meminfo)");

  return memoryStatsFromInfo(*info);
}

std::vector<NetInterfaceCounters> LinuxMetricSource::networkCounters() {
  const auto ifaces = platform::readInterfaceCounters();
  if (!ifaces) throw MetricError("network counters unavailable (/proc/net/dev)");

  // procfs exposes cumulative counters only; rates come from deltas.
  std::vector<NetInterfaceCounters> out;
  out.reserve(ifaces->size());
  for (const auto& i : *ifaces) {
    NetInterfaceCounters c;
    c.name = i.name;
    c.rxBytes = static_cast<double>(i.rxBytes);
    c.txBytes = static_cast<double>(i.txBytes);
    out.push_back(std::move(c));
  }
  return out;
}

std::vector<ProcessRecord> LinuxMetricSource::processList() {
  return processes_.sample();
}

OsIdentity LinuxMetricSource::osIdentity() {
  const platform::OsRelease rel = platform::readOsRelease();
  return OsIdentity{rel.distro, rel.release, rel.kernel};
}

double LinuxMetricSource::uptimeSeconds() {
  const auto up = platform::readUptimeSeconds();
  if (!up) throw MetricError("uptime unavailable (/proc/uptime)");
  return *up;
}

LoadAverage LinuxMetricSource::loadAverage() {
  const auto la = platform::readLoadAvg();
  if (!la) throw MetricError("load average unavailable (/proc/loadavg)");
  return LoadAverage{la->one, la->five, la->fifteen};
}

BatteryStatus LinuxMetricSource::batteryStatus() {
  BatteryStatus out;
  if (const auto pct = platform::readBatteryPercent()) {
    out.present = true;
    out.percent = *pct;
  }
  return out;
}

}  // namespace matricx
