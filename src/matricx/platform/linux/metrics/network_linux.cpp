#include <matricx/platform/metrics/network.h>

#include <cctype>
#include <fstream>
#include <sstream>

namespace matricx::platform {

static std::string trim(std::string s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
  return s;
}

std::optional<std::vector<InterfaceCounters>> readInterfaceCounters() {
  std::ifstream in("/proc/net/dev");
  if (!in.is_open()) return std::nullopt;

  // Two header lines.
  std::string line;
  std::getline(in, line);
  std::getline(in, line);

  std::vector<InterfaceCounters> out;
  while (std::getline(in, line)) {
    const auto colon = line.find(':');
    if (colon == std::string::npos) continue;

    std::string iface = trim(line.substr(0, colon));
    if (iface.empty() || iface == "lo") continue;

    std::istringstream iss(line.substr(colon + 1));
    InterfaceCounters c;
    c.name = std::move(iface);

    iss >> c.rxBytes;
    for (int i = 0; i < 7; ++i) {
      std::uint64_t dummy = 0;
      iss >> dummy;
    }
    iss >> c.txBytes;
    if (!iss) continue;

    out.push_back(std::move(c));
  }

  return out;
}

}  // namespace matricx::platform
