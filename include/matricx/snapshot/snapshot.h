// SPDX-License-Identifier: MIT
// Snapshot - one-shot JSON rendition of the dashboard's data

#pragma once

#include <matricx/metrics/host_snapshot.h>
#include <matricx/metrics/metric_source.h>
#include <matricx/metrics/rate_estimator.h>

#include <chrono>
#include <string>

namespace matricx {

/// A host snapshot plus the values derived from it for display.
struct SnapshotRecord {
  std::string timestamp;  // UTC, ISO-8601
  HostSnapshot host;
  std::string primaryInterface;
  RateUpdate rates;
};

/// Gathers twice, `settle` apart, so CPU and network figures are deltas
/// rather than since-boot averages.
SnapshotRecord captureSnapshot(IMetricSource& source,
                               std::chrono::milliseconds settle = std::chrono::milliseconds(250));

/// Convert a snapshot to a single-line JSON object.
///
/// Keys: timestamp, cpu{total_percent, cores[]}, memory{total_bytes,
/// used_bytes, active_bytes, percent}, network{interface, rx_bytes,
/// tx_bytes, rx_bytes_per_sec, tx_bytes_per_sec}, processes[] (top 15 by
/// CPU then RSS), services[], os{distro, release, kernel}, uptime_seconds,
/// load_average[3], battery{present, percent}.
std::string snapshotToJson(const SnapshotRecord& snapshot);

}  // namespace matricx
