#pragma once

#include <matricx/config/config.h>

namespace matricx {

struct PanelRect {
  int top = 0;
  int height = 0;
};

// Panel geometry for one terminal size. Recomputed every tick.
struct DashboardLayout {
  int width = 0;
  int height = 0;
  // Columns inside a full-width bordered panel (>= 10).
  int innerWidth = 10;

  PanelRect header;
  PanelRect cpu;
  PanelRect memory;
  PanelRect network;
  PanelRect processes;
  PanelRect services;
  PanelRect footer;

  // Process table rows below the column heading.
  int processRows = 5;
};

DashboardLayout computeLayout(int width, int height, const Config& cfg = Config{});

}  // namespace matricx
