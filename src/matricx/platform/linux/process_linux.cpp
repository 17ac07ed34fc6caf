#include <matricx/platform/process.h>

#include <matricx/platform/metrics/cpu.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

#include <dirent.h>
#include <unistd.h>

namespace matricx::platform {
namespace {

// Name and utime+stime from /proc/<pid>/stat. The comm field may contain
// spaces and parentheses, so it is delimited by the first '(' and last ')'.
static bool readProcStatTimes(int pid, std::uint64_t& procJiffies, std::string& nameOut) {
  std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
  if (!in.is_open()) return false;

  std::string line;
  if (!std::getline(in, line)) return false;

  const std::size_t lparen = line.find('(');
  const std::size_t rparen = line.rfind(')');
  if (lparen == std::string::npos || rparen == std::string::npos || rparen <= lparen) return false;

  nameOut = line.substr(lparen + 1, rparen - lparen - 1);
  if (rparen + 2 >= line.size()) return false;

  std::istringstream iss(line.substr(rparen + 2));
  std::string state;
  iss >> state;

  unsigned long long dummy = 0;
  for (int i = 0; i < 10; ++i) {
    if (!(iss >> dummy)) return false;
  }

  unsigned long long utime = 0;
  unsigned long long stime = 0;
  if (!(iss >> utime >> stime)) return false;

  procJiffies = static_cast<std::uint64_t>(utime + stime);
  return true;
}

static std::uint64_t readProcRssBytes(int pid, long pageSize) {
  std::ifstream in("/proc/" + std::to_string(pid) + "/statm");
  if (!in.is_open()) return 0;

  std::uint64_t sizePages = 0;
  std::uint64_t residentPages = 0;
  if (!(in >> sizePages >> residentPages)) return 0;
  return residentPages * static_cast<std::uint64_t>(pageSize);
}

static bool isDigits(const char* s) {
  if (!s || !*s) return false;
  for (const char* p = s; *p; ++p) {
    if (*p < '0' || *p > '9') return false;
  }
  return true;
}

}  // namespace

std::vector<ProcessInfo> enumerateProcesses() {
  std::vector<ProcessInfo> out;

  DIR* dir = ::opendir("/proc");
  if (!dir) return out;

  long pageSize = ::sysconf(_SC_PAGESIZE);
  if (pageSize <= 0) pageSize = 4096;

  struct dirent* ent = nullptr;
  while ((ent = ::readdir(dir)) != nullptr) {
    if (ent->d_type != DT_DIR && ent->d_type != DT_UNKNOWN) continue;
    if (!isDigits(ent->d_name)) continue;
    const int pid = std::atoi(ent->d_name);
    if (pid <= 0) continue;

    // Processes may exit between readdir() and the reads below.
    std::uint64_t procJiffies = 0;
    std::string name;
    if (!readProcStatTimes(pid, procJiffies, name)) continue;

    ProcessInfo info;
    info.pid = static_cast<ProcessId>(pid);
    info.name = std::move(name);
    info.cpuJiffies = procJiffies;
    info.memoryBytes = readProcRssBytes(pid, pageSize);
    out.push_back(std::move(info));
  }

  ::closedir(dir);
  return out;
}

std::optional<std::uint64_t> readTotalCpuJiffies() {
  const auto stat = readCpuStat();
  if (!stat) return std::nullopt;
  return stat->aggregate.total;
}

}  // namespace matricx::platform
