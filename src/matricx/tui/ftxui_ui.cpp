#include <matricx/tui/ftxui_ui.h>

#include <matricx/metrics/linux_metric_source.h>
#include <matricx/metrics/synthetic_metric_source.h>
#include <matricx/tui/dashboard.h>
#include <matricx/tui/markup.h>

#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/color.hpp>
#include <ftxui/screen/terminal.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace matricx {

namespace {

static ftxui::Color toFtxuiColor(ColorClass c) {
  switch (c) {
    case ColorClass::Green:
      return ftxui::Color::Green;
    case ColorClass::Yellow:
      return ftxui::Color::Yellow;
    case ColorClass::Red:
      return ftxui::Color::Red;
    case ColorClass::Cyan:
      return ftxui::Color::Cyan;
    case ColorClass::Magenta:
      return ftxui::Color::Magenta;
    case ColorClass::White:
      return ftxui::Color::White;
    case ColorClass::Default:
    default:
      return ftxui::Color::Default;
  }
}

static ftxui::Element markupLine(const std::string& line) {
  using namespace ftxui;
  Elements runs;
  for (const auto& run : parseMarkup(line)) {
    Element elem = text(run.text);
    if (run.color != ColorClass::Default) elem = elem | color(toFtxuiColor(run.color));
    runs.push_back(elem);
  }
  if (runs.empty()) runs.push_back(text(""));
  return hbox(std::move(runs));
}

static ftxui::Element panelBody(const PanelText& lines) {
  ftxui::Elements rows;
  rows.reserve(lines.size());
  for (const auto& l : lines) rows.push_back(markupLine(l));
  return ftxui::vbox(std::move(rows));
}

static ftxui::Element panel(const char* title, const PanelText& lines, int height) {
  using namespace ftxui;
  return window(text(title), panelBody(lines)) | size(HEIGHT, EQUAL, height);
}

static std::unique_ptr<IMetricSource> makeSource(bool debugMode) {
  if (debugMode) return std::make_unique<SyntheticMetricSource>();
  return std::make_unique<LinuxMetricSource>();
}

}  // namespace

int FtxuiUi::run(Config& cfg) {
  auto source = makeSource(cfg.debug);

  DashboardState state;
  state.cfg = cfg;

  // Written by the sampling thread, read by the renderer.
  std::mutex publishMutex;
  DashboardPanels published;

  auto screen = ftxui::ScreenInteractive::Fullscreen();

  auto renderer = ftxui::Renderer([&] {
    using namespace ftxui;
    const auto dims = Terminal::Size();
    const DashboardLayout layout = computeLayout(dims.dimx, dims.dimy, cfg);

    DashboardPanels p;
    {
      std::lock_guard<std::mutex> lk(publishMutex);
      p = published;
    }

    return vbox({
               text(p.header) | size(HEIGHT, EQUAL, layout.header.height),
               panel(" CPU ", p.cpu, layout.cpu.height),
               panel(" Memory ", p.memory, layout.memory.height),
               panel(" Network ", p.network, layout.network.height),
               window(text(" Processes "), panelBody(p.processes)) | flex,
               panel(" Services ", p.services, layout.services.height),
               border(panelBody(p.footer)) | size(HEIGHT, EQUAL, layout.footer.height),
           }) |
           size(WIDTH, EQUAL, dims.dimx) | size(HEIGHT, EQUAL, dims.dimy);
  });

  auto component = ftxui::CatchEvent(renderer, [&](ftxui::Event event) {
    if (event == ftxui::Event::Custom) {
      return false;
    }
    if (event == ftxui::Event::Character('q') || event == ftxui::Event::Character('Q') ||
        event == ftxui::Event::Escape) {
      screen.Exit();
      return true;
    }
    return false;
  });

  // Background sampling loop: first tick immediately, then every refreshMs.
  std::atomic<bool> stopUpdate{false};
  std::mutex wakeMutex;
  std::condition_variable wake;

  std::thread updateThread([&]() {
    auto next = std::chrono::steady_clock::now();
    while (!stopUpdate) {
      const auto dims = ftxui::Terminal::Size();
      runTick(state, *source, dims.dimx, dims.dimy);
      {
        std::lock_guard<std::mutex> lk(publishMutex);
        published = state.panels;
      }

      // Request screen refresh
      screen.PostEvent(ftxui::Event::Custom);

      next += std::chrono::milliseconds(cfg.refreshMs);
      const auto now = std::chrono::steady_clock::now();
      if (next < now) next = now;
      std::unique_lock<std::mutex> lk(wakeMutex);
      wake.wait_until(lk, next, [&] { return stopUpdate.load(); });
    }
  });

  screen.Loop(component);

  // Cleanup
  {
    std::lock_guard<std::mutex> lk(wakeMutex);
    stopUpdate = true;
  }
  wake.notify_all();
  if (updateThread.joinable()) {
    updateThread.join();
  }

  return 0;
}

std::unique_ptr<Ui> makeUi() {
  return std::make_unique<FtxuiUi>();
}

}  // namespace matricx
