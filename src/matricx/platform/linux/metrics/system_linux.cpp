#include <matricx/platform/metrics/system.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <sys/utsname.h>

namespace fs = std::filesystem;

namespace matricx::platform {

static constexpr const char* kUnknown = "unknown";

static std::string trim(std::string s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
  return s;
}

static std::string unquote(std::string v) {
  if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
    v = v.substr(1, v.size() - 2);
  }
  return v;
}

static std::optional<std::string> readFirstLine(const fs::path& path) {
  std::ifstream in(path);
  if (!in.is_open()) return std::nullopt;
  std::string line;
  if (!std::getline(in, line)) return std::nullopt;
  return trim(line);
}

OsRelease readOsRelease() {
  OsRelease out;

  std::string name;
  std::string versionId;
  std::string version;

  std::ifstream in("/etc/os-release");
  std::string line;
  while (in.is_open() && std::getline(in, line)) {
    const auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    const std::string key = line.substr(0, eq);
    const std::string val = unquote(trim(line.substr(eq + 1)));

    if (key == "NAME") name = val;
    else if (key == "VERSION_ID") versionId = val;
    else if (key == "VERSION") version = val;
  }

  out.distro = name.empty() ? std::string(kUnknown) : name;
  out.release = !versionId.empty() ? versionId : (!version.empty() ? version : std::string(kUnknown));

  struct utsname uts {};
  if (::uname(&uts) == 0) {
    out.kernel = uts.release;
  } else {
    out.kernel = kUnknown;
  }
  return out;
}

std::optional<double> readUptimeSeconds() {
  std::ifstream in("/proc/uptime");
  if (!in.is_open()) return std::nullopt;
  double up = 0.0;
  if (!(in >> up)) return std::nullopt;
  return up;
}

std::optional<LoadAvg> readLoadAvg() {
  std::ifstream in("/proc/loadavg");
  if (!in.is_open()) return std::nullopt;
  LoadAvg avg;
  if (!(in >> avg.one >> avg.five >> avg.fifteen)) return std::nullopt;
  return avg;
}

std::optional<double> readBatteryPercent() {
  const fs::path root("/sys/class/power_supply");
  std::error_code ec;
  if (!fs::is_directory(root, ec)) return std::nullopt;

  std::vector<fs::path> supplies;
  for (const auto& entry : fs::directory_iterator(root, ec)) {
    supplies.push_back(entry.path());
  }
  std::sort(supplies.begin(), supplies.end());

  for (const auto& dir : supplies) {
    const auto type = readFirstLine(dir / "type");
    if (!type || *type != "Battery") continue;

    const auto capacity = readFirstLine(dir / "capacity");
    if (!capacity || capacity->empty()) continue;
    try {
      return std::stod(*capacity);
    } catch (const std::exception&) {
      continue;
    }
  }
  return std::nullopt;
}

}  // namespace matricx::platform
