#pragma once

#include <matricx/config/config.h>
#include <matricx/metrics/metric_source.h>
#include <matricx/metrics/rate_estimator.h>
#include <matricx/tui/panels.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace matricx {

// Text of every panel as last committed.
struct DashboardPanels {
  std::string header = "Matricx";
  PanelText cpu;
  PanelText memory;
  PanelText network;
  PanelText processes;
  PanelText services;
  PanelText footer;
};

// Owned by the sampling thread.
struct DashboardState {
  Config cfg;
  RateState rates;
  DashboardPanels panels;
  std::optional<std::string> lastError;
  std::uint64_t ticks = 0;
};

// Renders a fetched snapshot into every panel and advances the rate state.
void applySnapshot(DashboardState& state,
                   const HostSnapshot& snap,
                   int termWidth,
                   int termHeight,
                   const std::string& timestamp);

// One sampling tick. A failed gather only replaces the header; every other
// panel keeps its previous text. Returns false on failure.
bool runTick(DashboardState& state, IMetricSource& source, int termWidth, int termHeight);

}  // namespace matricx
