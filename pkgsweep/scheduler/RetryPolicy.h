/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>

#include "pkgsweep/config/Configuration.h"
#include "pkgsweep/statuses/Outcome.h"

namespace facebook { namespace pkgsweep {

struct ResultRow;

/**
 * Early retry: a crash of a job whose configuration traces on retry is
 * re-run right away under the tracer, to capture a recording.
 */
bool shouldRetraceCrash(const Outcome& first, TracingMode configured);

// The traced attempt replaces the first only if it reproduced the crash.
bool keepTracedOutcome(const Outcome& first, const Outcome& traced);

/**
 * Late retry: once every configuration has a row for a package, its `fail`
 * rows are re-run without the shared caches, if that could tell us
 * something.  Crashes are never retried, since their errors are valuable,
 * nor are kills, which are too expensive.
 *
 * Retrying is worthwhile with a single configuration, if only some
 * configurations failed (did they cause it?), or if the failures differ
 * in status or reason.
 *
 * Returns the names of the configurations to retry, in row order; empty
 * if it is not worthwhile.
 */
std::vector<std::string> lateRetryConfigurations(
  const std::vector<const ResultRow*>& package_rows,
  size_t num_configurations
);

}}  // namespace facebook::pkgsweep
