// SPDX-License-Identifier: MIT
// Snapshot implementation - gathers from a metric source and serializes

#include <matricx/snapshot/snapshot.h>

#include <matricx/metrics/sampler.h>
#include <matricx/metrics/services.h>
#include <matricx/snapshot/json_writer.h>
#include <matricx/tui/panels.h>

#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace matricx {

namespace {

constexpr std::size_t kSnapshotProcesses = 15;

std::string getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&time, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

}  // namespace

SnapshotRecord captureSnapshot(IMetricSource& source, std::chrono::milliseconds settle) {
  // Prime the delta-based readings (CPU jiffies, network counters).
  const HostSnapshot first = gatherSnapshot(source);
  const RateUpdate primed = updateRates(RateState{}, first.interfaces, first.sampledAt);
  std::this_thread::sleep_for(settle);

  SnapshotRecord rec;
  rec.host = gatherSnapshot(source);
  rec.rates = updateRates(primed.state, rec.host.interfaces, rec.host.sampledAt);
  if (const auto* primary = selectPrimaryInterface(rec.host.interfaces)) {
    rec.primaryInterface = primary->name;
  }
  rec.timestamp = getCurrentTimestamp();
  return rec;
}

std::string snapshotToJson(const SnapshotRecord& snapshot) {
  const HostSnapshot& h = snapshot.host;

  json::ObjectBuilder root;
  root.addString("timestamp", snapshot.timestamp);

  {
    json::ArrayBuilder cores;
    for (double c : h.cpu.perCore) cores.addNumber(c);
    json::ObjectBuilder cpu;
    cpu.addNumber("total_percent", h.cpu.total);
    cpu.addRaw("cores", cores.build());
    root.addRaw("cpu", cpu.build());
  }

  {
    json::ObjectBuilder mem;
    mem.addInt("total_bytes", static_cast<std::int64_t>(h.memory.totalBytes));
    mem.addInt("used_bytes", static_cast<std::int64_t>(h.memory.usedBytes));
    mem.addInt("active_bytes", static_cast<std::int64_t>(h.memory.activeBytes));
    mem.addNumber("percent", memoryFraction(h.memory) * 100.0);
    root.addRaw("memory", mem.build());
  }

  {
    json::ObjectBuilder net;
    net.addString("interface", snapshot.primaryInterface);
    const auto* primary = selectPrimaryInterface(h.interfaces);
    net.addNumber("rx_bytes", primary ? primary->rxBytes : 0.0);
    net.addNumber("tx_bytes", primary ? primary->txBytes : 0.0);
    net.addNumber("rx_bytes_per_sec", snapshot.rates.rxPerSec);
    net.addNumber("tx_bytes_per_sec", snapshot.rates.txPerSec);
    root.addRaw("network", net.build());
  }

  {
    json::ArrayBuilder procs;
    for (const auto& p : rankProcesses(h.processes, kSnapshotProcesses)) {
      json::ObjectBuilder po;
      po.addString("name", p.name);
      po.addInt("pid", p.pid);
      po.addNumber("cpu_percent", p.cpuPercent);
      po.addNumber("rss_bytes", p.residentBytes);
      procs.addRaw(po.build());
    }
    root.addRaw("processes", procs.build());
  }

  {
    json::ArrayBuilder services;
    for (const auto& st : matchServices(h.processes)) {
      json::ObjectBuilder so;
      so.addString("name", st.entry ? std::string(st.entry->name) : std::string());
      so.addBool("running", st.running);
      if (st.pid) so.addInt("pid", *st.pid);
      if (st.cpuPercent) so.addNumber("cpu_percent", *st.cpuPercent);
      services.addRaw(so.build());
    }
    root.addRaw("services", services.build());
  }

  {
    json::ObjectBuilder os;
    os.addString("distro", h.os.distro);
    os.addString("release", h.os.release);
    os.addString("kernel", h.os.kernel);
    root.addRaw("os", os.build());
  }

  root.addNumber("uptime_seconds", h.uptimeSeconds);

  {
    json::ArrayBuilder load;
    load.addNumber(h.load.one);
    load.addNumber(h.load.five);
    load.addNumber(h.load.fifteen);
    root.addRaw("load_average", load.build());
  }

  {
    json::ObjectBuilder batt;
    batt.addBool("present", h.battery.present);
    if (h.battery.present) {
      batt.addNumber("percent", h.battery.percent);
    } else {
      batt.addNull("percent");
    }
    root.addRaw("battery", batt.build());
  }

  return root.build();
}

}  // namespace matricx
