#include <matricx/metrics/rate_estimator.h>

#include <matricx/numeric.h>

#include <algorithm>
#include <cmath>

namespace matricx {

namespace {

constexpr double kDecay = 0.95;
constexpr double kMinElapsedSec = 0.001;

static bool usableRate(const std::optional<double>& r) {
  return r && std::isfinite(*r) && *r > 0.0;
}

static double fractionOf(double rate, double observedMax) {
  if (observedMax <= 0.0) return 0.0;
  return std::clamp(std::fabs(finiteOr(rate)) / observedMax, 0.0, 1.0);
}

}  // namespace

double RateUpdate::rxFraction() const {
  return fractionOf(rxPerSec, state.observedMax);
}

double RateUpdate::txFraction() const {
  return fractionOf(txPerSec, state.observedMax);
}

const NetInterfaceCounters* selectPrimaryInterface(const std::vector<NetInterfaceCounters>& interfaces) {
  if (interfaces.empty()) return nullptr;
  for (const auto& i : interfaces) {
    if (finiteOr(i.rxBytes) + finiteOr(i.txBytes) != 0.0) return &i;
  }
  return &interfaces.front();
}

RateUpdate updateRates(const RateState& prev,
                       const std::vector<NetInterfaceCounters>& interfaces,
                       std::chrono::steady_clock::time_point now) {
  RateUpdate out;
  out.state = prev;

  if (const NetInterfaceCounters* primary = selectPrimaryInterface(interfaces)) {
    const double rxBytes = finiteOr(primary->rxBytes);
    const double txBytes = finiteOr(primary->txBytes);

    if (usableRate(primary->rxRate)) out.rxPerSec = *primary->rxRate;
    if (usableRate(primary->txRate)) out.txPerSec = *primary->txRate;

    if (!(out.rxPerSec > 0.0 || out.txPerSec > 0.0) && prev.last) {
      const double elapsed = std::chrono::duration<double>(now - prev.last->at).count();
      const double dt = std::max(kMinElapsedSec, finiteOr(elapsed));
      out.rxPerSec = (rxBytes - prev.last->rx) / dt;
      out.txPerSec = (txBytes - prev.last->tx) / dt;
    }

    out.state.last = NetSample{rxBytes, txBytes, now};
  }

  out.state.observedMax = std::max({finiteOr(prev.observedMax, 1.0) * kDecay, 1.0,
                                    std::fabs(out.rxPerSec), std::fabs(out.txPerSec)});
  return out;
}

}  // namespace matricx
