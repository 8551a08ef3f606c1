/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <set>
#include <string>
#include <vector>

#include "pkgsweep/config/Configuration.h"
#include "pkgsweep/config/Package.h"
#include "pkgsweep/scheduler/ResultTable.h"

namespace facebook { namespace pkgsweep {

/**
 * One evaluation of a package under a configuration.  Owned by the queue
 * until a worker pops it.  A late retry queues a new Job without the
 * shared caches.
 */
struct Job {
  Job(Configuration c, Package p, bool use_cache)
    : config(std::move(c)), package(std::move(p)), useSharedCache(use_cache) {}

  Configuration config;
  Package package;
  bool useSharedCache;
};

// The configuration a package is evaluated with: packages that the tracer
// cannot handle never trace.
Configuration jobConfiguration(
  const Configuration& config,
  const Package& package
);

struct JobPlan {
  std::vector<Job> jobs;  // In random order
  std::vector<ResultRow> skips;  // skip/blacklisted rows
};

/**
 * Every configuration times every package, except that packages named
 * *_jll are left out without a trace (they are binary wrappers with no
 * tests of their own), and `blacklist`ed packages become skip rows.
 *
 * Shuffled, so that the ETA is representative even if slow packages are
 * clustered alphabetically.
 */
JobPlan planJobs(
  const std::vector<Configuration>& configs,
  const std::vector<Package>& packages,
  const std::set<std::string>& blacklist
);

}}  // namespace facebook::pkgsweep
