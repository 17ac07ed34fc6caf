#include <matricx/tui/layout.h>

#include <algorithm>

namespace matricx {

namespace {

constexpr int kBorderCols = 2;
constexpr int kMinProcessHeight = 5;
constexpr int kProcessOverhead = 3;
constexpr int kBoxHeight = 3;

}  // namespace

DashboardLayout computeLayout(int width, int height, const Config& cfg) {
  DashboardLayout l;
  l.width = std::max(0, width);
  l.height = std::max(0, height);
  l.innerWidth = std::max(10, l.width - kBorderCols);

  l.header = {0, 1};
  l.cpu = {1, 6};
  l.memory = {7, 4};
  l.network = {11, 4};

  const int procHeight = std::max(kMinProcessHeight, l.height - cfg.processTop - cfg.reservedBottomRows);
  l.processes = {cfg.processTop, procHeight};
  l.processRows = std::max(kMinProcessHeight, procHeight - kProcessOverhead);

  l.footer = {l.height - kBoxHeight, kBoxHeight};
  l.services = {l.height - 2 * kBoxHeight, kBoxHeight};
  return l;
}

}  // namespace matricx
