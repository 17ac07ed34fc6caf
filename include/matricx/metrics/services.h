#pragma once

#include <matricx/metrics/host_snapshot.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace matricx {

struct ServiceCatalogEntry {
  std::string_view name;
  // Lowercase substrings matched against lowercased process names.
  std::vector<std::string_view> matches;
};

struct ServiceStatus {
  const ServiceCatalogEntry* entry = nullptr;
  bool running = false;
  std::optional<int> pid;
  std::optional<double> cpuPercent;
};

const std::vector<ServiceCatalogEntry>& serviceCatalog();

// One status per catalog entry, in catalog order. First process (in list
// order) containing any substring wins.
std::vector<ServiceStatus> matchServices(const std::vector<ProcessRecord>& processes,
                                         const std::vector<ServiceCatalogEntry>& catalog = serviceCatalog());

// "Name: {green-fg}running{/} (pid P C.C% CPU)" or "Name: {red-fg}stopped{/}".
std::string formatServiceStatus(const ServiceStatus& status);

}  // namespace matricx
