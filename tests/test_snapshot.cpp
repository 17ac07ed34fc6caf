#include <matricx/snapshot/json_writer.h>
#include <matricx/snapshot/snapshot.h>

#include "fake_metric_source.h"
#include "test_framework.h"

#include <chrono>
#include <limits>
#include <string>

using namespace matricx;
using matricx::testing::FakeMetricSource;

static SnapshotRecord sampleRecord() {
  SnapshotRecord rec;
  rec.timestamp = "2026-01-01T00:00:00Z";
  rec.host.cpu = CpuLoad{12.5, {10.0, 15.0}};
  rec.host.memory = MemoryStats{16000000000ull, 12000000000ull, 8000000000ull};
  NetInterfaceCounters eth;
  eth.name = "eth0";
  eth.rxBytes = 2048.0;
  eth.txBytes = 1024.0;
  rec.host.interfaces = {eth};
  rec.host.processes = {{"mongod", 200, 3.5, 1.0e6}, {"say \"hi\"", 201, 0.0, 0.0}};
  rec.host.os = OsIdentity{"Testix", "1.0", "6.1.0"};
  rec.host.uptimeSeconds = 120.0;
  rec.host.load = LoadAverage{0.5, 0.25, 0.125};
  rec.primaryInterface = "eth0";
  rec.rates.rxPerSec = 512.0;
  rec.rates.txPerSec = 256.0;
  return rec;
}

TEST_CASE("json::escape handles quotes and control characters") {
  REQUIRE(json::escape("a\"b\n") == "a\\\"b\\n");
  REQUIRE(json::escape(std::string("\x01", 1)) == "\\u0001");
  REQUIRE(json::escape("plain") == "plain");
}

TEST_CASE("json::number prints short values and nulls non-finite ones") {
  REQUIRE(json::number(0.5) == "0.5");
  REQUIRE(json::number(16000000000.0) == "16000000000");
  REQUIRE(json::number(std::numeric_limits<double>::quiet_NaN()) == "null");
}

TEST_CASE("ObjectBuilder and ArrayBuilder compose") {
  json::ArrayBuilder arr;
  arr.addNumber(1.0);
  arr.addRaw("\"x\"");

  json::ObjectBuilder obj;
  obj.addString("name", "matricx");
  obj.addInt("n", -3);
  obj.addBool("ok", true);
  obj.addNull("none");
  obj.addRaw("list", arr.build());
  REQUIRE(obj.build() == "{\"name\": \"matricx\", \"n\": -3, \"ok\": true, \"none\": null, \"list\": [1, \"x\"]}");
}

TEST_CASE("snapshotToJson emits the documented keys") {
  const std::string json = snapshotToJson(sampleRecord());

  REQUIRE(json.front() == '{');
  REQUIRE(json.back() == '}');
  REQUIRE(json.find("\"timestamp\": \"2026-01-01T00:00:00Z\"") != std::string::npos);
  REQUIRE(json.find("\"cpu\": {\"total_percent\": 12.5, \"cores\": [10, 15]}") != std::string::npos);
  REQUIRE(json.find("\"total_bytes\": 16000000000") != std::string::npos);
  REQUIRE(json.find("\"active_bytes\": 8000000000") != std::string::npos);
  REQUIRE(json.find("\"percent\": 50") != std::string::npos);
  REQUIRE(json.find("\"interface\": \"eth0\"") != std::string::npos);
  REQUIRE(json.find("\"rx_bytes_per_sec\": 512") != std::string::npos);
  REQUIRE(json.find("\"name\": \"say \\\"hi\\\"\"") != std::string::npos);
  REQUIRE(json.find("{\"name\": \"MongoDB\", \"running\": true, \"pid\": 200, \"cpu_percent\": 3.5}") !=
          std::string::npos);
  REQUIRE(json.find("{\"name\": \"Docker\", \"running\": false}") != std::string::npos);
  REQUIRE(json.find("\"os\": {\"distro\": \"Testix\", \"release\": \"1.0\", \"kernel\": \"6.1.0\"}") !=
          std::string::npos);
  REQUIRE(json.find("\"uptime_seconds\": 120") != std::string::npos);
  REQUIRE(json.find("\"load_average\": [0.5, 0.25, 0.125]") != std::string::npos);
  REQUIRE(json.find("\"battery\": {\"present\": false, \"percent\": null}") != std::string::npos);
  REQUIRE(json.find('\n') == std::string::npos);
}

TEST_CASE("captureSnapshot reports counter rates from two gathers") {
  FakeMetricSource source;
  source.rxStep = 4096.0;
  source.txStep = 0.0;
  const SnapshotRecord rec = captureSnapshot(source, std::chrono::milliseconds(0));

  REQUIRE(rec.primaryInterface == "eth0");
  REQUIRE(rec.rates.rxPerSec > 0.0);
  REQUIRE(rec.rates.txPerSec == 0.0);
  REQUIRE(rec.timestamp.size() == 20);
  REQUIRE(rec.timestamp.back() == 'Z');
  REQUIRE(rec.host.battery.present);
}
