/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <chrono>
#include <exception>
#include <folly/Optional.h>
#include <folly/Synchronized.h>
#include <set>
#include <string>
#include <vector>

#include "pkgsweep/config/Configuration.h"
#include "pkgsweep/config/Package.h"
#include "pkgsweep/scheduler/JobPlan.h"
#include "pkgsweep/scheduler/ProgressPrinter.h"
#include "pkgsweep/scheduler/ResultTable.h"

namespace facebook { namespace pkgsweep {

class CacheManager;
class CancellationToken;
class JobRunner;
class Registry;

struct EvaluationOptions {
  // Jobs that run at once.  Worker `i` is pinned to CPU `i`.
  size_t ninstances{1};
  // Early (traced) and late (without shared caches) retries.
  bool retry{true};
  // Verify the shared caches before starting.
  bool validate{false};
  // Never evaluated, unless the packages were named explicitly.
  std::set<std::string> blacklist;
  // SIGINT and SIGTERM cancel the run.
  bool handleSignals{true};
  // On a terminal, Ctrl-C cancels and '?' lists the running jobs.
  bool listenToKeys{true};
  bool progress{true};
};

/**
 * Evaluates packages under several configurations with a fixed pool of
 * worker threads, each of which pops jobs from a shared queue until it is
 * empty or the run is cancelled.
 *
 *   Evaluation e(&runner, &registry, &cache, &token, options);
 *   ResultTable results = e.run(configs, packages);
 *
 * run() returns one row per (configuration, package) that was evaluated,
 * followed by the rows of skipped jobs.  A cancelled run returns the rows
 * that completed before the cancellation, plus those of the jobs it
 * interrupted.  If evaluating a job throws,
 * the run is cancelled, and run() rethrows the first such exception once
 * every worker has exited.
 */
class Evaluation {
public:
  Evaluation(
    const JobRunner* runner,
    const Registry* registry,
    CacheManager* cache,  // May be null: no shared caches
    CancellationToken* token,
    EvaluationOptions options
  );

  ResultTable run(
    const std::vector<Configuration>& configs,
    const std::vector<Package>& packages
  );

private:
  struct RunningJob {
    std::string configName;
    std::string packageName;
    std::chrono::steady_clock::time_point startTime;
    double timeLimitSec;
  };

  struct State {
    std::vector<Job> queue;  // Popped from the back
    size_t totalJobs{0};  // Late retries add to this
    ResultTable results;
    std::vector<folly::Optional<RunningJob>> running;  // One per worker
    std::exception_ptr firstError;
  };

  void workerLoop(size_t worker, const std::vector<Configuration>& configs);
  Outcome attempt(size_t worker, const Job& job) const;
  void recordAndRetry(
    const Job& job,
    Outcome outcome,
    const std::vector<Configuration>& configs
  );

  ProgressSnapshot snapshot() const;
  std::vector<std::string> describeRunning() const;

  const JobRunner* runner_;
  const Registry* registry_;
  CacheManager* cache_;
  CancellationToken* token_;
  const EvaluationOptions options_;

  std::chrono::steady_clock::time_point startTime_;
  folly::Synchronized<State> state_;
};

}}  // namespace facebook::pkgsweep
