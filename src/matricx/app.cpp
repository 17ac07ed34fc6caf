#include <matricx/app.h>

#include <matricx/config/config.h>
#include <matricx/metrics/linux_metric_source.h>
#include <matricx/metrics/synthetic_metric_source.h>
#include <matricx/snapshot/snapshot.h>
#include <matricx/tui/ui.h>
#include <matricx/version.h>

#include <clocale>
#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

#include <unistd.h>

namespace matricx {

static constexpr const char* kAppDisplayName = "Matricx";

static void printHelp(std::ostream& os) {
  os << "Matricx live system dashboard (CPU, memory, network, processes, services)\n"
        "\n"
        "Usage:\n"
        "  matricx [--yes|-y] [--style <blocks|shaded|ascii>] [--debug]\n"
        "  matricx --json\n"
        "\n"
        "Options:\n"
        "  --yes, -y    Non-interactive; never prompt\n"
        "  --json       Print one JSON snapshot and exit\n"
        "  --style S    Bar glyphs: blocks (default), shaded, ascii\n"
        "  --debug      Run with a synthetic metric source\n"
        "  --help, -h   Show this help and exit\n"
        "  --version    Print version and exit\n"
        "\n"
        "Keys: q / Esc / Ctrl+C quit\n";
}

static void setTerminalTitle(std::string_view title) {
  // Only emit OSC title sequences when stdout is a TTY.
  if (!::isatty(::fileno(stdout))) return;
  // OSC 0 (icon + window title), BEL-terminated.
  std::fputs("\x1b]0;", stdout);
  std::fwrite(title.data(), 1, title.size(), stdout);
  std::fputc('\a', stdout);
  std::fflush(stdout);
}

static int runJsonSnapshot(const Config& cfg) {
  std::unique_ptr<IMetricSource> source;
  if (cfg.debug) {
    source = std::make_unique<SyntheticMetricSource>();
  } else {
    source = std::make_unique<LinuxMetricSource>();
  }

  try {
    const SnapshotRecord snapshot = captureSnapshot(*source);
    std::cout << snapshotToJson(snapshot) << "\n";
  } catch (const std::exception& e) {
    std::cerr << "matricx: snapshot failed: " << e.what() << "\n";
    return 1;
  }
  return 0;
}

int App::run(int argc, char** argv) {
  if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
    printHelp(std::cout);
    return 0;
  }

  if (hasFlag(argc, argv, "--version")) {
    std::cout << kAppDisplayName << " " << MATRICX_VERSION << "\n";
    return 0;
  }

  std::string error;
  auto parsed = Config::fromArgs(argc, argv, &error);
  if (!parsed) {
    std::cerr << "matricx: " << error << "\n";
    return 1;
  }
  Config config = *parsed;

  if (config.jsonSnapshot) {
    return runJsonSnapshot(config);
  }

  if (!::isatty(::fileno(stdin)) || !::isatty(::fileno(stdout))) {
    std::cerr << "matricx: cannot attach to the terminal (stdin/stdout is not a TTY)\n";
    return 1;
  }

  std::setlocale(LC_ALL, "");
  setTerminalTitle(kAppDisplayName);

  if (config.debug) {
    std::cerr << "matricx: debug mode enabled (synthetic metrics)\n";
    std::cerr << "matricx: glyph style " << glyphStyleToString(config.glyphStyle) << ", refresh "
              << config.refreshMs << " ms\n";
    std::cerr << "matricx: creating UI...\n";
    std::cerr.flush();
  }

  auto ui = makeUi();

  if (config.debug) {
    std::cerr << "matricx: UI created, calling run()...\n";
    std::cerr.flush();
  }

  return ui->run(config);
}

}  // namespace matricx
