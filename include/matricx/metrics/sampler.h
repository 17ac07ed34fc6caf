#pragma once

#include <matricx/metrics/host_snapshot.h>
#include <matricx/metrics/metric_source.h>

namespace matricx {

// Issues every source query concurrently and waits for all of them. Rethrows
// the first failure; a failing battery query is reported as no battery.
HostSnapshot gatherSnapshot(IMetricSource& source);

}  // namespace matricx
