/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/scheduler/EtaEstimator.h"

#include <cmath>
#include <folly/Format.h>
#include <limits>

namespace facebook { namespace pkgsweep {

folly::Optional<double> estimateRemainingSec(
    size_t total_jobs,
    size_t completed_jobs,
    double elapsed_sec,
    const std::vector<RunningJobTiming>& running) {
  if (completed_jobs == 0 || running.size() > total_jobs) {
    return folly::none;
  }
  double idle_jobs = total_jobs - running.size();
  double total_sec = idle_jobs * elapsed_sec / completed_jobs;
  if (!running.empty()) {
    const RunningJobTiming* newest = &running.front();
    for (const auto& r : running) {
      if (r.elapsedSec < newest->elapsedSec) {
        newest = &r;
      }
    }
    total_sec += newest->timeLimitSec - newest->elapsedSec;
  }
  if (!(total_sec >= 0 && total_sec <= std::numeric_limits<int>::max())) {
    return folly::none;
  }
  return total_sec - elapsed_sec;
}

std::string formatDuration(double seconds) {
  int64_t s = seconds > 0 ? std::llround(seconds) : 0;
  auto days = s / 86400;
  s %= 86400;
  auto hms =
    folly::format("{}:{:02d}:{:02d}", s / 3600, (s / 60) % 60, s % 60).str();
  if (days == 0) {
    return hms;
  }
  return folly::format("{} day{}, {}", days, days == 1 ? "" : "s", hms).str();
}

}}  // namespace facebook::pkgsweep
