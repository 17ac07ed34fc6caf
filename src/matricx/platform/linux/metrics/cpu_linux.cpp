#include <matricx/platform/metrics/cpu.h>

#include <cctype>
#include <fstream>
#include <sstream>
#include <string>

namespace matricx::platform {

static bool parseCpuLine(const std::string& line, CpuTimes& out) {
  std::istringstream iss(line);
  std::string label;
  iss >> label;

  std::uint64_t user = 0, nice = 0, system = 0, idle = 0, iowait = 0, irq = 0, softirq = 0, steal = 0;
  if (!(iss >> user >> nice >> system >> idle)) return false;
  iss >> iowait >> irq >> softirq >> steal;

  out.idle = idle + iowait;
  out.total = user + nice + system + idle + iowait + irq + softirq + steal;
  return out.total != 0;
}

std::optional<CpuStat> readCpuStat() {
  std::ifstream in("/proc/stat");
  if (!in.is_open()) return std::nullopt;

  CpuStat stat;
  bool sawAggregate = false;

  std::string line;
  while (std::getline(in, line)) {
    if (line.rfind("cpu", 0) != 0) continue;

    CpuTimes t;
    if (line.size() > 3 && std::isdigit(static_cast<unsigned char>(line[3]))) {
      if (parseCpuLine(line, t)) stat.perCore.push_back(t);
    } else if (!sawAggregate) {
      if (!parseCpuLine(line, t)) return std::nullopt;
      stat.aggregate = t;
      sawAggregate = true;
    }
  }

  if (!sawAggregate) return std::nullopt;
  return stat;
}

}  // namespace matricx::platform
