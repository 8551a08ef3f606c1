/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/dynamic.h>
#include <folly/Optional.h>
#include <folly/Range.h>
#include <string>
#include <vector>

#include "pkgsweep/statuses/Outcome.h"

namespace facebook { namespace pkgsweep {

/**
 * One attempt of one job, or a job that was skipped without running.
 * Skips have no version, no duration and no log.
 */
struct ResultRow {
  ResultRow() {}
  ResultRow(
    std::string config_name,
    std::string package_name,
    const Outcome& outcome
  );
  static ResultRow skip(
    std::string config_name,
    std::string package_name,
    Reason reason
  );

  folly::dynamic toDynamic() const;

  std::string configuration;
  std::string package;
  folly::Optional<std::string> version;
  Status status{Status::Skip};
  folly::Optional<Reason> reason;
  double duration{0.0};
  folly::Optional<std::string> log;
};

/**
 * The results of an evaluation.  Append-only while it runs, which keeps
 * every retry visible until deduplicate().  Not thread-safe.
 */
class ResultTable {
public:
  void append(ResultRow row) { rows_.emplace_back(std::move(row)); }
  void append(const std::vector<ResultRow>& rows) {
    rows_.insert(rows_.end(), rows.begin(), rows.end());
  }

  const std::vector<ResultRow>& rows() const { return rows_; }
  size_t size() const { return rows_.size(); }

  std::vector<const ResultRow*> rowsForPackage(folly::StringPiece name) const;
  size_t count(Status status) const;

  /**
   * Keeps only the last row of each (configuration, package), at the
   * position of that pair's first row.  Returns how many rows were
   * dropped.
   */
  size_t deduplicate();

  // An array of objects, in row order, with null for absent values:
  //   {"configuration": "stable", "package": "Example", "version": "1.2.3",
  //    "status": "fail", "reason": "test_failures", "duration": 12.3,
  //    "log": "..."}
  folly::dynamic toDynamic() const;

private:
  std::vector<ResultRow> rows_;
};

// Writes toDynamic() as pretty JSON to `fd`, or to `filename`.  Throws on
// failure.
void writeResults(const ResultTable& results, int fd);
void writeResults(const ResultTable& results, const std::string& filename);

}}  // namespace facebook::pkgsweep
