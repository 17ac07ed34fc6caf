#include <matricx/tui/panels.h>

#include <matricx/metrics/services.h>
#include <matricx/numeric.h>
#include <matricx/tui/format.h>
#include <matricx/tui/gauge.h>
#include <matricx/tui/markup.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <ctime>

namespace matricx {

namespace {

constexpr std::size_t kPidWidth = 6;
constexpr int kCpuWidth = 6;
constexpr int kRssWidth = 10;
constexpr int kColumnGap = 2;

constexpr const char* kSeparator = "  |  ";
constexpr const char* kTitle = "Matricx";

static std::string joinWith(const std::vector<std::string>& parts, const char* sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += sep;
    out += parts[i];
  }
  return out;
}

static std::string percentText(double pct) {
  return fmtFixed(pct, 1) + "%";
}

static std::string coreItem(std::size_t index, double pct, int miniBarWidth) {
  const double p = finiteOr(pct);
  const std::string bar = renderMiniBar(std::clamp(p / 100.0, 0.0, 1.0), miniBarWidth, pctColor(p));
  const long rounded = std::lround(p);
  return "C" + std::to_string(index + 1) + ":" + bar + " " + padLeft(std::to_string(rounded), 2, '0') + "%";
}

}  // namespace

PanelText renderCpuPanel(const CpuLoad& cpu, int innerWidth, const Config& cfg) {
  const double pct = finiteOr(cpu.total);

  std::vector<std::string> cores;
  cores.reserve(cpu.perCore.size());
  for (std::size_t i = 0; i < cpu.perCore.size(); ++i) {
    cores.push_back(coreItem(i, cpu.perCore[i], cfg.miniBarWidth));
  }
  const std::size_t half = (cores.size() + 1) / 2;
  const std::vector<std::string> first(cores.begin(), cores.begin() + static_cast<std::ptrdiff_t>(half));
  const std::vector<std::string> second(cores.begin() + static_cast<std::ptrdiff_t>(half), cores.end());

  AlignedLine line;
  line.fraction = pct / 100.0;
  line.readout = percentText(pct) + " | cores: " + std::to_string(cores.size());
  line.color = pctColor(pct);

  return {
      composeAlignedLine(line, innerWidth, cfg.glyphStyle),
      spaceEvenly(first, innerWidth),
      spaceEvenly(second, innerWidth),
  };
}

double memoryFraction(const MemoryStats& mem) {
  if (mem.totalBytes == 0) return 0.0;
  const std::uint64_t used = mem.activeBytes ? mem.activeBytes : mem.usedBytes;
  return finiteOr(static_cast<double>(used) / static_cast<double>(mem.totalBytes));
}

PanelText renderMemoryPanel(const MemoryStats& mem, int innerWidth, GlyphStyle style) {
  const double used = static_cast<double>(mem.activeBytes ? mem.activeBytes : mem.usedBytes);
  const double total = static_cast<double>(mem.totalBytes);
  const double pct = memoryFraction(mem) * 100.0;

  AlignedLine line;
  line.fraction = pct / 100.0;
  line.readout = percentText(pct);
  line.color = pctColor(pct);

  return {
      composeAlignedLine(line, innerWidth, style),
      " " + humanizeBytes(used) + " / " + humanizeBytes(total) + " (" + percentText(pct) + ")",
  };
}

PanelText renderNetworkPanel(const RateUpdate& rates, int innerWidth, GlyphStyle style) {
  AlignedLine down;
  down.label = "Down";
  down.fraction = rates.rxFraction();
  down.readout = humanizeBytes(rates.rxPerSec) + "/s";
  down.color = rateColor(rates.rxPerSec);

  AlignedLine up;
  up.label = "Up  ";
  up.fraction = rates.txFraction();
  up.readout = humanizeBytes(rates.txPerSec) + "/s";
  up.color = rateColor(rates.txPerSec);

  return {composeAlignedLine(down, innerWidth, style), composeAlignedLine(up, innerWidth, style)};
}

std::vector<ProcessRecord> rankProcesses(std::vector<ProcessRecord> processes, std::size_t limit) {
  std::stable_sort(processes.begin(), processes.end(), [](const ProcessRecord& a, const ProcessRecord& b) {
    const double ac = finiteOr(a.cpuPercent);
    const double bc = finiteOr(b.cpuPercent);
    if (ac != bc) return ac > bc;
    return finiteOr(a.residentBytes) > finiteOr(b.residentBytes);
  });
  if (processes.size() > limit) processes.resize(limit);
  return processes;
}

PanelText renderProcessPanel(const std::vector<ProcessRecord>& processes, int innerWidth, int rows) {
  const std::size_t rowCount = static_cast<std::size_t>(std::max(0, rows));
  const std::size_t lineWidth = static_cast<std::size_t>(std::max(0, innerWidth));
  const auto ranked = rankProcesses(processes, rowCount);

  // PIDs above 999999 widen the column and the name column gives way.
  std::size_t pidWidth = kPidWidth;
  for (const auto& p : ranked) pidWidth = std::max(pidWidth, std::to_string(p.pid).size());

  const int fixed = static_cast<int>(pidWidth) + kCpuWidth + kRssWidth + kColumnGap * 3;
  const std::size_t nameW = static_cast<std::size_t>(std::max(0, innerWidth - fixed));
  const std::string gap(kColumnGap, ' ');

  PanelText lines;
  lines.reserve(rowCount + 1);
  lines.push_back(clipVisible(takeCodePoints(padRight("NAME", nameW), nameW) + gap + padLeft("PID", pidWidth) +
                                  gap + padLeft("CPU%", kCpuWidth) + gap + padLeft("RSS", kRssWidth),
                              lineWidth));

  for (const auto& p : ranked) {
    lines.push_back(clipVisible(padRight(escapeMarkup(truncateMiddle(p.name, nameW)), nameW) + gap +
                                    padLeft(std::to_string(p.pid), pidWidth) + gap +
                                    padLeft(fmtFixed(p.cpuPercent, 1), kCpuWidth) + gap +
                                    padLeft(humanizeBytes(p.residentBytes), kRssWidth),
                                lineWidth));
  }

  while (lines.size() < rowCount + 1) lines.emplace_back();
  return lines;
}

PanelText renderServicesPanel(const std::vector<ProcessRecord>& processes) {
  std::vector<std::string> parts;
  for (const auto& st : matchServices(processes)) parts.push_back(formatServiceStatus(st));
  return {joinWith(parts, kSeparator)};
}

std::string formatUptime(double seconds) {
  const double s = std::max(0.0, finiteOr(seconds));
  const auto total = static_cast<long long>(std::floor(s));
  const long long days = total / 86400;
  const long long hours = (total % 86400) / 3600;
  const long long minutes = (total % 3600) / 60;
  return std::to_string(days) + "d " + std::to_string(hours) + "h " + std::to_string(minutes) + "m";
}

std::string formatLocalTimestamp(std::chrono::system_clock::time_point t) {
  const std::time_t tt = std::chrono::system_clock::to_time_t(t);
  std::tm tm{};
  if (!localtime_r(&tt, &tm)) return {};
  char buf[64];
  const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return std::string(buf, n);
}

PanelText renderFooterPanel(const OsIdentity& os,
                            double uptimeSeconds,
                            const LoadAverage& load,
                            const BatteryStatus& battery,
                            const std::string& timestamp) {
  const std::string battText =
      battery.present ? std::to_string(std::lround(finiteOr(battery.percent))) + "%" : std::string("N/A");

  const std::vector<std::string> parts = {
      colorize(os.distro + " " + os.release + " (" + os.kernel + ")", ColorClass::Green),
      colorize("Uptime: " + formatUptime(uptimeSeconds), ColorClass::Cyan),
      colorize("Load Avg: " + fmtFixed(load.one, 2) + ", " + fmtFixed(load.five, 2) + ", " + fmtFixed(load.fifteen, 2),
               ColorClass::Yellow),
      colorize("Battery: " + battText, ColorClass::Magenta),
      colorize(timestamp, ColorClass::White),
  };
  return {joinWith(parts, kSeparator)};
}

std::string headerTitle(const std::optional<std::string>& error) {
  if (!error) return kTitle;
  return std::string(kTitle) + " (error: " + *error + ")";
}

}  // namespace matricx
