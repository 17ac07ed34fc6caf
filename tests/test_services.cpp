#include <matricx/metrics/services.h>
#include <matricx/tui/panels.h>

#include "test_framework.h"

#include <stdexcept>
#include <string>
#include <vector>

using namespace matricx;

static const ServiceStatus& statusFor(const std::vector<ServiceStatus>& all, const std::string& name) {
  for (const auto& s : all) {
    if (s.entry && s.entry->name == name) return s;
  }
  throw std::runtime_error("no catalog entry " + name);
}

TEST_CASE("Service catalog lists the known services in order") {
  const auto& catalog = serviceCatalog();
  REQUIRE(catalog.size() == 7);
  REQUIRE(catalog[0].name == "Docker");
  REQUIRE(catalog[1].name == "MongoDB");
  REQUIRE(catalog[6].name == "Apache");
}

TEST_CASE("Service matching is case-insensitive substring containment") {
  const std::vector<ProcessRecord> byDisplayName = {{"MongoDB Server", 7, 1.0, 0.0}};
  REQUIRE(statusFor(matchServices(byDisplayName), "MongoDB").running);

  const std::vector<ProcessRecord> unrelated = {{"notmongo-unrelated", 8, 0.0, 0.0}};
  const auto st = statusFor(matchServices(unrelated), "MongoDB");
  REQUIRE(st.running);
  REQUIRE(*st.pid == 8);
}

TEST_CASE("First matching process wins") {
  const std::vector<ProcessRecord> procs = {
      {"redis-cli", 10, 0.1, 0.0},
      {"redis-server", 11, 9.0, 0.0},
  };
  const auto st = statusFor(matchServices(procs), "Redis");
  REQUIRE(st.running);
  REQUIRE(*st.pid == 10);
}

TEST_CASE("Unmatched services are stopped") {
  const auto all = matchServices({{"bash", 1, 0.0, 0.0}});
  REQUIRE(all.size() == serviceCatalog().size());
  for (const auto& s : all) {
    REQUIRE_FALSE(s.running);
    REQUIRE_FALSE(s.pid.has_value());
  }
}

TEST_CASE("Service status text") {
  const std::vector<ProcessRecord> procs = {{"mongod", 42, 3.5, 0.0}};
  const auto all = matchServices(procs);
  REQUIRE(formatServiceStatus(statusFor(all, "MongoDB")) == "MongoDB: {green-fg}running{/} (pid 42 3.5% CPU)");
  REQUIRE(formatServiceStatus(statusFor(all, "Docker")) == "Docker: {red-fg}stopped{/}");
}

TEST_CASE("Services panel joins every status on one line") {
  const PanelText lines = renderServicesPanel({{"httpd", 5, 0.0, 0.0}});
  REQUIRE(lines.size() == 1);
  REQUIRE(lines[0].rfind("Docker: {red-fg}stopped{/}  |  MongoDB: ", 0) == 0);
  REQUIRE(lines[0].find("Apache: {green-fg}running{/} (pid 5 0.0% CPU)") != std::string::npos);

  std::size_t separators = 0;
  for (std::size_t pos = lines[0].find("  |  "); pos != std::string::npos; pos = lines[0].find("  |  ", pos + 1)) {
    ++separators;
  }
  REQUIRE(separators == 6);
}
