#pragma once

#include <matricx/metrics/host_snapshot.h>

#include <chrono>
#include <optional>
#include <vector>

namespace matricx {

struct NetSample {
  double rx = 0.0;
  double tx = 0.0;
  std::chrono::steady_clock::time_point at{};
};

// Smoothing state carried from one tick to the next. observedMax >= 1.
struct RateState {
  std::optional<NetSample> last;
  double observedMax = 1.0;
};

struct RateUpdate {
  RateState state;
  // Bytes per second. May be negative after a counter reset.
  double rxPerSec = 0.0;
  double txPerSec = 0.0;

  double rxFraction() const;
  double txFraction() const;
};

// First interface with traffic, else the first one; nullptr when empty.
const NetInterfaceCounters* selectPrimaryInterface(const std::vector<NetInterfaceCounters>& interfaces);

// Reported rates win when finite and > 0 in either direction. Otherwise the
// rate is the counter delta against prev.last, over at least 1 ms.
RateUpdate updateRates(const RateState& prev,
                       const std::vector<NetInterfaceCounters>& interfaces,
                       std::chrono::steady_clock::time_point now);

}  // namespace matricx
