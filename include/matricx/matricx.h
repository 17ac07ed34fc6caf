// SPDX-License-Identifier: MIT
// matricx-core - Main header for the matricx dashboard library
//
// Include this single header to access all public matricx-core APIs.
// For more granular control, include individual headers instead.

#pragma once

// Version info
#include <matricx/version.h>

// Metrics - host sampling
#include <matricx/metrics/metric_source.h>        // IMetricSource, MetricError
#include <matricx/metrics/linux_metric_source.h>  // procfs/sysfs source
#include <matricx/metrics/sampler.h>              // gatherSnapshot()
#include <matricx/metrics/rate_estimator.h>       // Network rate smoothing
#include <matricx/metrics/services.h>             // Known service detection

// Text rendering
#include <matricx/tui/gauge.h>
#include <matricx/tui/panels.h>
#include <matricx/tui/dashboard.h>

// Snapshot - JSON output
#include <matricx/snapshot/snapshot.h>            // captureSnapshot(), snapshotToJson()
