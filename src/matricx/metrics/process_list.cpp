#include <matricx/metrics/process_list.h>

#include <matricx/platform/process.h>

namespace matricx {

std::vector<ProcessRecord> ProcessSampler::sample() {
  std::vector<ProcessRecord> out;

  const auto totalJiffies = platform::readTotalCpuJiffies();
  if (!totalJiffies) return out;

  const std::uint64_t deltaTotal =
      (hasPrev_ && *totalJiffies > prevTotalJiffies_) ? (*totalJiffies - prevTotalJiffies_) : 0;

  std::unordered_map<int, std::uint64_t> curProcJiffies;
  curProcJiffies.reserve(1024);

  const auto processes = platform::enumerateProcesses();
  out.reserve(processes.size());
  for (const auto& p : processes) {
    const int pid = static_cast<int>(p.pid);
    curProcJiffies[pid] = p.cpuJiffies;

    double cpuPct = 0.0;
    if (deltaTotal > 0) {
      auto it = prevProcJiffies_.find(pid);
      if (it != prevProcJiffies_.end() && p.cpuJiffies >= it->second) {
        const std::uint64_t deltaProc = p.cpuJiffies - it->second;
        cpuPct = 100.0 * (static_cast<double>(deltaProc) / static_cast<double>(deltaTotal));
      }
    }

    out.push_back(ProcessRecord{p.name, pid, cpuPct, static_cast<double>(p.memoryBytes)});
  }

  prevTotalJiffies_ = *totalJiffies;
  prevProcJiffies_ = std::move(curProcJiffies);
  hasPrev_ = true;
  return out;
}

}  // namespace matricx
