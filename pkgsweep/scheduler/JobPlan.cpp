/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/scheduler/JobPlan.h"

#include <algorithm>
#include <folly/Random.h>
#include <folly/Range.h>

#include "pkgsweep/config/PackageLists.h"

namespace facebook { namespace pkgsweep {

Configuration jobConfiguration(
    const Configuration& config,
    const Package& package) {
  if (config.tracing == TracingMode::Disabled ||
      !untracedPackages().count(package.name)) {
    return config;
  }
  Configuration::Overrides o;
  o.tracing = TracingMode::Disabled;
  return config.with(o);
}

JobPlan planJobs(
    const std::vector<Configuration>& configs,
    const std::vector<Package>& packages,
    const std::set<std::string>& blacklist) {
  std::vector<Job> all;
  for (const auto& config : configs) {
    for (const auto& package : packages) {
      all.emplace_back(jobConfiguration(config, package), package, true);
    }
  }
  std::shuffle(all.begin(), all.end(), folly::ThreadLocalPRNG());

  JobPlan plan;
  for (auto& job : all) {
    if (folly::StringPiece(job.package.name).endsWith("_jll")) {
      continue;
    }
    if (blacklist.count(job.package.name)) {
      plan.skips.emplace_back(ResultRow::skip(
        job.config.name, job.package.name, Reason::Blacklisted
      ));
      continue;
    }
    plan.jobs.emplace_back(std::move(job));
  }
  return plan;
}

}}  // namespace facebook::pkgsweep
