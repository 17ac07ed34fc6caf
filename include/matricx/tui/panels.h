#pragma once

#include <matricx/config/config.h>
#include <matricx/metrics/host_snapshot.h>
#include <matricx/metrics/rate_estimator.h>
#include <matricx/tui/layout.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace matricx {

// Markup lines for one panel.
using PanelText = std::vector<std::string>;

PanelText renderCpuPanel(const CpuLoad& cpu, int innerWidth, const Config& cfg);

// (active ? active : used) / total, 0 for an empty total.
double memoryFraction(const MemoryStats& mem);
PanelText renderMemoryPanel(const MemoryStats& mem, int innerWidth, GlyphStyle style);

PanelText renderNetworkPanel(const RateUpdate& rates, int innerWidth, GlyphStyle style);

// Stable sort by CPU% desc, then RSS desc; keeps the first `limit`.
std::vector<ProcessRecord> rankProcesses(std::vector<ProcessRecord> processes, std::size_t limit);

// Column heading plus exactly `rows` lines (blank when short of processes).
PanelText renderProcessPanel(const std::vector<ProcessRecord>& processes, int innerWidth, int rows);

PanelText renderServicesPanel(const std::vector<ProcessRecord>& processes);

// "Xd Yh Zm"
std::string formatUptime(double seconds);
std::string formatLocalTimestamp(std::chrono::system_clock::time_point t);

PanelText renderFooterPanel(const OsIdentity& os,
                            double uptimeSeconds,
                            const LoadAverage& load,
                            const BatteryStatus& battery,
                            const std::string& timestamp);

std::string headerTitle(const std::optional<std::string>& error);

}  // namespace matricx
