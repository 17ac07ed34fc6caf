#include <matricx/platform/metrics/memory.h>

#include <fstream>
#include <sstream>
#include <string>

namespace matricx::platform {

std::optional<MemoryInfo> parseMemInfo(std::istream& in) {
  std::optional<std::uint64_t> totalKb;
  std::optional<std::uint64_t> availKb;
  std::uint64_t freeKb = 0;

  std::string line;
  while (std::getline(in, line)) {
    std::istringstream iss(line);
    std::string key;
    std::uint64_t v = 0;
    if (!(iss >> key >> v)) continue;

    if (key == "MemTotal:") totalKb = v;
    else if (key == "MemAvailable:") availKb = v;
    else if (key == "MemFree:") freeKb = v;
  }

  if (!totalKb || *totalKb == 0 || !availKb) return std::nullopt;

  MemoryInfo info;
  info.totalBytes = (*totalKb) * 1024ULL;
  info.availableBytes = (*availKb) * 1024ULL;
  info.freeBytes = freeKb * 1024ULL;
  return info;
}

std::optional<MemoryInfo> readMemoryInfo() {
  std::ifstream in("/proc/meminfo");
  if (!in.is_open()) return std::nullopt;
  return parseMemInfo(in);
}

}  // namespace matricx::platform
