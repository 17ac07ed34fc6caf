#include <matricx/metrics/sampler.h>

#include <exception>
#include <future>

namespace matricx {

HostSnapshot gatherSnapshot(IMetricSource& source) {
  auto cpu = std::async(std::launch::async, [&] { return source.currentLoad(); });
  auto mem = std::async(std::launch::async, [&] { return source.memory(); });
  auto net = std::async(std::launch::async, [&] { return source.networkCounters(); });
  auto procs = std::async(std::launch::async, [&] { return source.processList(); });
  auto os = std::async(std::launch::async, [&] { return source.osIdentity(); });
  auto up = std::async(std::launch::async, [&] { return source.uptimeSeconds(); });
  auto load = std::async(std::launch::async, [&] { return source.loadAverage(); });
  auto battery = std::async(std::launch::async, [&]() -> BatteryStatus {
    try {
      return source.batteryStatus();
    } catch (const std::exception&) {
      return BatteryStatus{};
    }
  });

  // Futures from std::async join in their destructors, so an early throw
  // still waits for the remaining queries before leaving this scope.
  HostSnapshot snap;
  snap.cpu = cpu.get();
  snap.memory = mem.get();
  snap.interfaces = net.get();
  snap.processes = procs.get();
  snap.os = os.get();
  snap.uptimeSeconds = up.get();
  snap.load = load.get();
  snap.battery = battery.get();
  snap.sampledAt = std::chrono::steady_clock::now();
  return snap;
}

}  // namespace matricx
