#include <matricx/metrics/rate_estimator.h>

#include "test_framework.h"

#include <chrono>
#include <string>
#include <vector>

using namespace matricx;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

static NetInterfaceCounters iface(const std::string& name, double rx, double tx) {
  NetInterfaceCounters c;
  c.name = name;
  c.rxBytes = rx;
  c.txBytes = tx;
  return c;
}

TEST_CASE("Rate estimator derives bytes/sec from counter deltas") {
  const auto t0 = steady_clock::time_point{} + std::chrono::seconds(100);
  RateState prev;
  prev.last = NetSample{1000.0, 2000.0, t0};

  const auto out = updateRates(prev, {iface("eth0", 1000.0 + 5242880.0, 2000.0 + 1048576.0)}, t0 + milliseconds(1000));
  REQUIRE(out.rxPerSec == 5242880.0);
  REQUIRE(out.txPerSec == 1048576.0);
  REQUIRE(out.state.observedMax == 5242880.0);
  REQUIRE(out.rxFraction() == 1.0);
  REQUIRE(out.txFraction() == 0.2);
}

TEST_CASE("Rate estimator divides by elapsed seconds") {
  const auto t0 = steady_clock::time_point{} + std::chrono::seconds(5);
  RateState prev;
  prev.last = NetSample{0.0, 0.0, t0};

  const auto out = updateRates(prev, {iface("eth0", 4000.0, 1000.0)}, t0 + milliseconds(2000));
  REQUIRE(out.rxPerSec == 2000.0);
  REQUIRE(out.txPerSec == 500.0);
}

TEST_CASE("Rate estimator clamps elapsed time to one millisecond") {
  const auto t0 = steady_clock::time_point{} + std::chrono::seconds(5);
  RateState prev;
  prev.last = NetSample{10.0, 10.0, t0};

  const auto out = updateRates(prev, {iface("eth0", 11.0, 10.0)}, t0);
  REQUIRE(out.rxPerSec > 999.0);
  REQUIRE(out.rxPerSec < 1001.0);
  REQUIRE(out.txPerSec == 0.0);
}

TEST_CASE("First tick has no rate but records the sample") {
  const auto now = steady_clock::time_point{} + std::chrono::seconds(1);
  const auto out = updateRates(RateState{}, {iface("eth0", 500.0, 700.0)}, now);
  REQUIRE(out.rxPerSec == 0.0);
  REQUIRE(out.txPerSec == 0.0);
  REQUIRE(out.state.last.has_value());
  REQUIRE(out.state.last->rx == 500.0);
  REQUIRE(out.state.last->tx == 700.0);
  REQUIRE(out.state.last->at == now);
  REQUIRE(out.state.observedMax == 1.0);
}

TEST_CASE("Reported positive rates win over counter deltas") {
  const auto t0 = steady_clock::time_point{} + std::chrono::seconds(1);
  RateState prev;
  prev.last = NetSample{0.0, 0.0, t0};

  auto c = iface("wlan0", 1.0e9, 1.0e9);
  c.rxRate = 300.0;
  const auto out = updateRates(prev, {c}, t0 + milliseconds(1000));
  REQUIRE(out.rxPerSec == 300.0);
  // The other direction is not back-filled from the counters.
  REQUIRE(out.txPerSec == 0.0);
  REQUIRE(out.state.last->rx == 1.0e9);
}

TEST_CASE("A reported rate of exactly zero falls back to counter deltas") {
  const auto t0 = steady_clock::time_point{} + std::chrono::seconds(1);
  RateState prev;
  prev.last = NetSample{100.0, 100.0, t0};

  auto c = iface("eth0", 1100.0, 300.0);
  c.rxRate = 0.0;
  c.txRate = 0.0;
  const auto out = updateRates(prev, {c}, t0 + milliseconds(1000));
  REQUIRE(out.rxPerSec == 1000.0);
  REQUIRE(out.txPerSec == 200.0);
}

TEST_CASE("observedMax decays by 5% per tick but never below 1") {
  RateState prev;
  prev.observedMax = 1000.0;
  const auto now = steady_clock::time_point{} + std::chrono::seconds(1);

  const auto a = updateRates(prev, {}, now);
  REQUIRE(a.state.observedMax > 949.999);
  REQUIRE(a.state.observedMax < 950.001);
  REQUIRE(a.rxPerSec == 0.0);

  RateState small;
  small.observedMax = 1.0;
  REQUIRE(updateRates(small, {}, now).state.observedMax == 1.0);

  RateState s;
  for (int i = 0; i < 500; ++i) {
    const double before = s.observedMax;
    s = updateRates(s, {}, now).state;
    REQUIRE(s.observedMax >= 1.0);
    REQUIRE(s.observedMax >= 0.95 * before);
  }
}

TEST_CASE("Empty interface list keeps the previous sample") {
  const auto t0 = steady_clock::time_point{} + std::chrono::seconds(1);
  RateState prev;
  prev.last = NetSample{42.0, 43.0, t0};
  const auto out = updateRates(prev, {}, t0 + milliseconds(1000));
  REQUIRE(out.state.last->rx == 42.0);
  REQUIRE(out.state.last->at == t0);
}

TEST_CASE("Primary interface is the first one with traffic") {
  const std::vector<NetInterfaceCounters> ifaces = {iface("docker0", 0, 0), iface("eth0", 10, 5), iface("wlan0", 99, 99)};
  REQUIRE(selectPrimaryInterface(ifaces)->name == "eth0");

  const std::vector<NetInterfaceCounters> idle = {iface("eth0", 0, 0), iface("eth1", 0, 0)};
  REQUIRE(selectPrimaryInterface(idle)->name == "eth0");

  REQUIRE(selectPrimaryInterface({}) == nullptr);
}
