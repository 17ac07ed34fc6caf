#include <matricx/metrics/services.h>

#include <matricx/numeric.h>

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace matricx {

namespace {

static std::string toLowerAscii(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

}  // namespace

const std::vector<ServiceCatalogEntry>& serviceCatalog() {
  static const std::vector<ServiceCatalogEntry> kCatalog = {
      {"Docker", {"dockerd", "docker", "containerd"}},
      {"MongoDB", {"mongod", "mongo"}},
      {"Postgres", {"postgres", "postgresql"}},
      {"MySQL", {"mysqld", "mysql"}},
      {"Redis", {"redis-server", "redis"}},
      {"Nginx", {"nginx"}},
      {"Apache", {"httpd", "apache2"}},
  };
  return kCatalog;
}

std::vector<ServiceStatus> matchServices(const std::vector<ProcessRecord>& processes,
                                         const std::vector<ServiceCatalogEntry>& catalog) {
  std::vector<std::string> lowered;
  lowered.reserve(processes.size());
  for (const auto& p : processes) lowered.push_back(toLowerAscii(p.name));

  std::vector<ServiceStatus> out;
  out.reserve(catalog.size());
  for (const auto& entry : catalog) {
    ServiceStatus st;
    st.entry = &entry;
    for (std::size_t i = 0; i < processes.size() && !st.running; ++i) {
      for (const auto m : entry.matches) {
        if (lowered[i].find(m) != std::string::npos) {
          st.running = true;
          st.pid = processes[i].pid;
          st.cpuPercent = finiteOr(processes[i].cpuPercent);
          break;
        }
      }
    }
    out.push_back(st);
  }
  return out;
}

std::string formatServiceStatus(const ServiceStatus& status) {
  std::string out = status.entry ? std::string(status.entry->name) : std::string("?");
  out += ": ";
  if (!status.running) {
    out += "{red-fg}stopped{/}";
    return out;
  }

  char buf[64];
  std::snprintf(buf, sizeof(buf), " (pid %d %.1f%% CPU)", status.pid.value_or(0), status.cpuPercent.value_or(0.0));
  out += "{green-fg}running{/}";
  out += buf;
  return out;
}

}  // namespace matricx
