/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/Optional.h>
#include <folly/Range.h>
#include <limits>
#include <string>
#include <vector>

namespace facebook { namespace pkgsweep {

/**
 * Coarse result of one job attempt.
 */
enum class Status : unsigned char {
  Ok,     // Tests ran and passed
  Skip,   // Intentionally not (fully) run, not an error
  Fail,   // The package itself failed, a retry may help
  Kill,   // We stopped the process due to a time / size / resource bound
  Crash,  // The runtime or the sandbox looks broken
};

/**
 * Fine-grained explanation of a Status.  The enumerators mirror
 * kReasonTable below, but only the table defines priority: code that
 * needs an order must use reasonSeverity().
 */
enum class Reason : unsigned char {
  // crash
  Abort,
  Internal,
  Unreachable,
  GCCorruption,
  Segfault,
  // fail
  Syntax,
  Uncompilable,
  TestFailures,
  BinaryDependency,
  MissingDependency,
  MissingPackage,
  Network,
  Unknown,
  // kill
  Inactivity,
  TimeLimit,
  LogLimit,
  ResourceLimit,
  // skip
  Untestable,
  Uninstallable,
  Unsupported,
  Blacklisted,
};

struct ReasonInfo {
  Reason reason;
  Status status;
  folly::StringPiece name;  // As serialized, e.g. "time_limit"
  folly::StringPiece message;
};

/**
 * The reason taxonomy, in priority order: when several reasons apply, the
 * earliest entry wins, and the position is the reason's severity.
 */
extern const std::vector<ReasonInfo> kReasonTable;

folly::StringPiece statusName(Status s);  // e.g. "ok"
folly::StringPiece statusMessage(Status s);  // e.g. "successful"
Status statusFromName(folly::StringPiece name);  // Throws if unknown

folly::StringPiece reasonName(Reason r);
Reason reasonFromName(folly::StringPiece name);  // Throws if unknown
Status reasonStatus(Reason r);

// Prose for a reason.  An absent or unrecognized reason yields
// "unknown reason" rather than an identifier.
std::string reasonMessage(folly::Optional<Reason> r);

// Index into kReasonTable, lower sorts first.  Absent and unrecognized
// reasons sort after every known one.
constexpr size_t kUnknownReasonSeverity = std::numeric_limits<size_t>::max();
size_t reasonSeverity(folly::Optional<Reason> r);

/**
 * The terminal record of one job attempt.  Produced once, then only
 * copied around.
 */
struct Outcome {
  Status status{Status::Fail};
  folly::Optional<Reason> reason;
  std::string log;
  folly::Optional<std::string> version;  // As resolved by the package manager
  double duration{0.0};  // Test duration reported by the job, in seconds

  // True if this attempt classifies the same way as `other`.
  bool sameClassification(const Outcome& other) const {
    return status == other.status && reason == other.reason;
  }
};

}}  // namespace facebook::pkgsweep
