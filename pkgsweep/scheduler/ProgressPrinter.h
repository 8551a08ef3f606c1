/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "pkgsweep/scheduler/EtaEstimator.h"
#include "pkgsweep/utils/BackgroundThreads.h"

namespace facebook { namespace pkgsweep {

class CancellationToken;

struct ProgressSnapshot {
  size_t totalJobs{0};  // Grows with late retries
  size_t completed{0};
  size_t ok{0};
  size_t fail{0};
  size_t crash{0};
  size_t kill{0};
  std::vector<RunningJobTiming> running;
  double elapsedSec{0.0};
};

// Running tests:  42%|########            | 420/1000 [ok 400, fail 15, ...]
std::string progressBar(const ProgressSnapshot& s, size_t bar_width = 30);

// Running tests: 580 remaining (ETA: 1:02:03)
std::string progressLine(const ProgressSnapshot& s);

/**
 * Reports the progress of an Evaluation from a background thread.  On a
 * terminal, the bar on stderr is redrawn every second.  Otherwise, a line
 * is logged, at intervals that start at 1 second and grow by half each
 * time, until they exceed 5 minutes, so that long runs do not flood the
 * logs.  Stops printing once the token is cancelled.
 */
class ProgressPrinter {
public:
  using SnapshotFn = std::function<ProgressSnapshot()>;

  ProgressPrinter(
    SnapshotFn snapshot,
    const CancellationToken* token,
    bool interactive
  );
  ~ProgressPrinter();

  ProgressPrinter(const ProgressPrinter&) = delete;
  ProgressPrinter& operator=(const ProgressPrinter&) = delete;

  void start();
  // Idempotent.  On a terminal, draws the final state and ends the line.
  void stop();

private:
  std::chrono::milliseconds tick();

  SnapshotFn snapshot_;
  const CancellationToken* token_;
  const bool interactive_;
  std::chrono::milliseconds sleep_{1000};
  bool stopped_{false};

  BackgroundThreads threads_;  // Must be last
};

}}  // namespace facebook::pkgsweep
