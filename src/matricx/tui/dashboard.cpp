#include <matricx/tui/dashboard.h>

#include <matricx/metrics/sampler.h>
#include <matricx/tui/layout.h>

#include <exception>

namespace matricx {

void applySnapshot(DashboardState& state,
                   const HostSnapshot& snap,
                   int termWidth,
                   int termHeight,
                   const std::string& timestamp) {
  const DashboardLayout layout = computeLayout(termWidth, termHeight, state.cfg);
  const RateUpdate rates = updateRates(state.rates, snap.interfaces, snap.sampledAt);

  // Build everything first so a throw cannot leave half-updated panels.
  DashboardPanels next;
  next.header = headerTitle(std::nullopt);
  next.cpu = renderCpuPanel(snap.cpu, layout.innerWidth, state.cfg);
  next.memory = renderMemoryPanel(snap.memory, layout.innerWidth, state.cfg.glyphStyle);
  next.network = renderNetworkPanel(rates, layout.innerWidth, state.cfg.glyphStyle);
  next.processes = renderProcessPanel(snap.processes, layout.innerWidth, layout.processRows);
  next.services = renderServicesPanel(snap.processes);
  next.footer = renderFooterPanel(snap.os, snap.uptimeSeconds, snap.load, snap.battery, timestamp);

  state.panels = std::move(next);
  state.rates = rates.state;
  state.lastError.reset();
}

bool runTick(DashboardState& state, IMetricSource& source, int termWidth, int termHeight) {
  ++state.ticks;
  try {
    const HostSnapshot snap = gatherSnapshot(source);
    applySnapshot(state, snap, termWidth, termHeight, formatLocalTimestamp(std::chrono::system_clock::now()));
    return true;
  } catch (const std::exception& e) {
    state.lastError = e.what();
    state.panels.header = headerTitle(state.lastError);
    return false;
  }
}

}  // namespace matricx
