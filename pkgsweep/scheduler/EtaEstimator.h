/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/Optional.h>
#include <string>
#include <vector>

namespace facebook { namespace pkgsweep {

struct RunningJobTiming {
  double elapsedSec;
  double timeLimitSec;  // The effective limit of its configuration
};

/**
 * Seconds until the evaluation completes, or none when the estimate is
 * meaningless (e.g. nothing has completed yet).
 *
 * Jobs that are not running are assumed to take the average time of the
 * completed ones.  Running jobs are pessimistically assumed to run into
 * their time limit: the evaluation cannot end before the most recently
 * started job does.
 *
 *   total = idle_jobs * elapsed / completed
 *         + newest.timeLimit - newest.elapsed
 *   eta = total - elapsed, provided that 0 <= total <= INT_MAX
 */
folly::Optional<double> estimateRemainingSec(
  size_t total_jobs,
  size_t completed_jobs,
  double elapsed_sec,
  const std::vector<RunningJobTiming>& running
);

// "0:05:07", or "2 days, 3:04:05".  Negative durations format as zero.
std::string formatDuration(double seconds);

}}  // namespace facebook::pkgsweep
