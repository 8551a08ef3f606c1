/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/scheduler/RetryPolicy.h"

#include <set>

#include "pkgsweep/scheduler/ResultTable.h"

namespace facebook { namespace pkgsweep {

bool shouldRetraceCrash(const Outcome& first, TracingMode configured) {
  return first.status == Status::Crash &&
    configured == TracingMode::EnabledOnRetry;
}

bool keepTracedOutcome(const Outcome& first, const Outcome& traced) {
  return traced.sameClassification(first);
}

std::vector<std::string> lateRetryConfigurations(
    const std::vector<const ResultRow*>& package_rows,
    size_t num_configurations) {
  // Judge once, when the last configuration reports.  Later rows come from
  // retries, which are never retried again.
  if (package_rows.size() != num_configurations) {
    return {};
  }
  std::vector<const ResultRow*> failures;
  std::set<Status> statuses;
  std::set<size_t> reasons;
  for (const auto* row : package_rows) {
    if (row->status == Status::Fail) {
      failures.push_back(row);
      statuses.insert(row->status);
      reasons.insert(reasonSeverity(row->reason));
    }
  }
  bool worthy = num_configurations == 1 ||
    failures.size() != num_configurations ||
    statuses.size() > 1 ||
    reasons.size() > 1;
  std::vector<std::string> names;
  if (worthy) {
    for (const auto* row : failures) {
      names.push_back(row->configuration);
    }
  }
  return names;
}

}}  // namespace facebook::pkgsweep
