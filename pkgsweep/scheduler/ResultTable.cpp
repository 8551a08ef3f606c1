/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/scheduler/ResultTable.h"

#include <folly/FileUtil.h>
#include <folly/json.h>
#include <map>

#include "pkgsweep/utils/Exception.h"

namespace facebook { namespace pkgsweep {

namespace {

template <typename T>
folly::dynamic optionalToDynamic(const folly::Optional<T>& v) {
  return v.has_value() ? folly::dynamic(*v) : folly::dynamic(nullptr);
}

}  // anonymous namespace

ResultRow::ResultRow(
    std::string config_name,
    std::string package_name,
    const Outcome& outcome)
  : configuration(std::move(config_name)),
    package(std::move(package_name)),
    version(outcome.version),
    status(outcome.status),
    reason(outcome.reason),
    duration(outcome.duration),
    log(outcome.log) {}

ResultRow ResultRow::skip(
    std::string config_name,
    std::string package_name,
    Reason reason) {
  ResultRow row;
  row.configuration = std::move(config_name);
  row.package = std::move(package_name);
  row.status = Status::Skip;
  row.reason = reason;
  return row;
}

folly::dynamic ResultRow::toDynamic() const {
  return folly::dynamic::object
    ("configuration", configuration)
    ("package", package)
    ("version", optionalToDynamic(version))
    ("status", statusName(status))
    ("reason", reason ? folly::dynamic(reasonName(*reason)) : nullptr)
    ("duration", duration)
    ("log", optionalToDynamic(log));
}

std::vector<const ResultRow*> ResultTable::rowsForPackage(
    folly::StringPiece name) const {
  std::vector<const ResultRow*> out;
  for (const auto& row : rows_) {
    if (row.package == name) {
      out.push_back(&row);
    }
  }
  return out;
}

size_t ResultTable::count(Status status) const {
  size_t n = 0;
  for (const auto& row : rows_) {
    n += (row.status == status);
  }
  return n;
}

size_t ResultTable::deduplicate() {
  std::map<std::pair<std::string, std::string>, size_t> index;
  std::vector<ResultRow> deduped;
  for (auto& row : rows_) {
    auto p = index.emplace(
      std::make_pair(row.configuration, row.package), deduped.size()
    );
    if (p.second) {
      deduped.emplace_back(std::move(row));
    } else {
      deduped[p.first->second] = std::move(row);
    }
  }
  size_t removed = rows_.size() - deduped.size();
  rows_ = std::move(deduped);
  return removed;
}

folly::dynamic ResultTable::toDynamic() const {
  folly::dynamic d = folly::dynamic::array;
  for (const auto& row : rows_) {
    d.push_back(row.toDynamic());
  }
  return d;
}

void writeResults(const ResultTable& results, int fd) {
  auto json = folly::toPrettyJson(results.toDynamic()) + "\n";
  if (folly::writeFull(fd, json.data(), json.size()) == -1) {
    throw PkgSweepException("Could not write the results: ", strError());
  }
}

void writeResults(const ResultTable& results, const std::string& filename) {
  auto json = folly::toPrettyJson(results.toDynamic()) + "\n";
  if (!folly::writeFile(json, filename.c_str())) {
    throw PkgSweepException("Could not write ", filename, ": ", strError());
  }
}

}}  // namespace facebook::pkgsweep
