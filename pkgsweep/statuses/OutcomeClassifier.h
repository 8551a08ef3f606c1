/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/regex.hpp>
#include <folly/Optional.h>
#include <folly/Range.h>
#include <string>
#include <vector>

#include "pkgsweep/statuses/Outcome.h"

namespace facebook { namespace pkgsweep {

/**
 * Either a plain substring or a boost::regex searched anywhere in a log.
 */
class LogPattern {
public:
  static LogPattern substring(std::string s);
  static LogPattern regex(const std::string& re);

  bool matches(folly::StringPiece log) const;

private:
  LogPattern() {}

  std::string substring_;
  folly::Optional<boost::regex> regex_;
};

/**
 * Log text that implies `reason`.  Signatures are kept in ordered lists:
 * the first one with a matching pattern wins.
 */
struct LogSignature {
  Reason reason;
  std::vector<LogPattern> patterns;

  bool matches(folly::StringPiece log) const;
};

// Runtime crash signatures, which override even a successful exit.
const std::vector<LogSignature>& crashSignatures();
// Failure explanations, tried in order for `fail` outcomes.  The last one
// (Unknown) always matches.
const std::vector<LogSignature>& failureSignatures();

// Printed by the package manager when a package has no test entry point.
std::string noTestsMarker(folly::StringPiece package_name);

struct ClassifierInput {
  std::string packageName;
  // As resolved by the process supervisor from watchdogs and exit status.
  Status status;
  folly::Optional<Reason> reason;
  // From the side channel, false if the job never reported it.
  bool installed{false};
};

struct Classification {
  Status status;
  folly::Optional<Reason> reason;
};

/**
 * Refines the supervisor's verdict using the side channel and the log:
 *  - Unless we killed the process: a failed install means
 *    skip/uninstallable, the "no tests" marker means skip/untestable, and
 *    any crash signature overrides to a crash, even after a clean exit.
 *  - A `fail` is then explained by the first matching failure signature.
 */
Classification classifyOutcome(
  const ClassifierInput& input,
  folly::StringPiece log
);

// A `fail` of the image-compilation step is always `uncompilable`.
Classification classifyCompilation(
  Status status,
  folly::Optional<Reason> reason
);

// "PkgSweep failed after 12.34s: package has test failures\n"
std::string outcomeTrailer(
  Status status,
  folly::Optional<Reason> reason,
  double elapsed_sec
);

// "Image compilation failed: compilation of the package failed\n"
std::string compilationTrailer(Status status, folly::Optional<Reason> reason);

}}  // namespace facebook::pkgsweep
