/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/statuses/OutcomeClassifier.h"

#include <folly/Conv.h>
#include <folly/Format.h>
#include <glog/logging.h>

namespace facebook { namespace pkgsweep {

LogPattern LogPattern::substring(std::string s) {
  LogPattern p;
  p.substring_ = std::move(s);
  return p;
}

LogPattern LogPattern::regex(const std::string& re) {
  LogPattern p;
  p.regex_ = boost::regex(re);
  return p;
}

bool LogPattern::matches(folly::StringPiece log) const {
  if (regex_.has_value()) {
    return boost::regex_search(log.begin(), log.end(), *regex_);
  }
  return log.find(substring_) != folly::StringPiece::npos;
}

bool LogSignature::matches(folly::StringPiece log) const {
  for (const auto& pattern : patterns) {
    if (pattern.matches(log)) {
      return true;
    }
  }
  return false;
}

// Tried in this order, which is not the severity order of the reason
// table: a GC corruption usually ends in a segfault or abort, and the
// corruption is the better explanation.
const std::vector<LogSignature>& crashSignatures() {
  static const std::vector<LogSignature> kSignatures{
    {Reason::GCCorruption, {
      LogPattern::substring("GC error (probable corruption)"),
    }},
    {Reason::Unreachable, {
      LogPattern::substring("Unreachable reached"),
    }},
    {Reason::Internal, {
      LogPattern::substring(
        "Internal error: encountered unexpected error in runtime"),
      LogPattern::substring(
        "Internal error: stack overflow in type inference"),
      LogPattern::substring(
        "Internal error: encountered unexpected error during compilation"),
    }},
    {Reason::Abort, {
      // Runtime signal handler
      LogPattern::regex(R"(signal \([^\n]+\): Abort)"),
      LogPattern::substring("(received signal: 6)"),  // Package manager
    }},
    {Reason::Segfault, {
      LogPattern::regex(R"(signal \([^\n]+\): Segmentation fault)"),
      LogPattern::substring("(received signal: 11)"),
    }},
  };
  return kSignatures;
}

const std::vector<LogSignature>& failureSignatures() {
  static const std::vector<LogSignature> kSignatures{
    {Reason::BinaryDependency, {
      LogPattern::substring(
        "cannot open shared object file: No such file or directory"),
    }},
    {Reason::MissingDependency, {
      LogPattern::regex(
        R"(Package [^\n]+ does not have [^\n]+ in its dependencies)"),
    }},
    {Reason::MissingPackage, {
      LogPattern::regex(R"(Package [^\n]+ not found in current path)"),
    }},
    {Reason::Network, {
      LogPattern::substring("failed to clone from"),
      LogPattern::regex(R"(HTTP/\d \d+ while requesting)"),
      LogPattern::substring("Could not resolve host"),
      LogPattern::substring("Resolving timed out after"),
      LogPattern::substring("Could not download"),
      LogPattern::regex(R"(Error: HTTP/\d \d+)"),
      LogPattern::substring("Temporary failure in name resolution"),
      LogPattern::substring("listen: address already in use"),
      LogPattern::substring("connect: connection refused"),
    }},
    {Reason::Syntax, {
      LogPattern::substring("ERROR: LoadError: syntax"),
    }},
    {Reason::TestFailures, {
      LogPattern::substring("Some tests did not pass"),
      LogPattern::substring("Test Failed"),
    }},
    {Reason::Unknown, {LogPattern::substring("")}},
  };
  return kSignatures;
}

std::string noTestsMarker(folly::StringPiece package_name) {
  return folly::to<std::string>(
    "Package ", package_name, " did not provide a `test/runtests.jl` file"
  );
}

Classification classifyOutcome(
    const ClassifierInput& input,
    folly::StringPiece log) {
  Classification c{input.status, input.reason};
  if (c.status != Status::Kill) {
    if (!input.installed) {
      c = {Status::Skip, Reason::Uninstallable};
    } else if (log.find(noTestsMarker(input.packageName))
                 != folly::StringPiece::npos) {
      c = {Status::Skip, Reason::Untestable};
    }
    // Sub-invocations can crash while the top-level process exits cleanly.
    for (const auto& sig : crashSignatures()) {
      if (sig.matches(log)) {
        c = {Status::Crash, sig.reason};
        break;
      }
    }
  }
  if (c.status == Status::Fail) {
    for (const auto& sig : failureSignatures()) {
      if (sig.matches(log)) {
        c.reason = sig.reason;
        break;
      }
    }
  }
  return c;
}

Classification classifyCompilation(
    Status status,
    folly::Optional<Reason> reason) {
  if (status == Status::Fail) {
    return {status, Reason::Uncompilable};
  }
  return {status, reason};
}

namespace {

folly::StringPiece dispositionWord(Status status) {
  switch (status) {
    case Status::Ok:
      return "succeeded";
    case Status::Skip:
      return "skipped";
    case Status::Fail:
      return "failed";
    case Status::Kill:
      return "terminated";
    case Status::Crash:
      return "crashed";
  }
  LOG(FATAL) << "Unknown status " << static_cast<int>(status);
}

std::string reasonSuffix(folly::Optional<Reason> reason) {
  if (!reason.has_value()) {
    return "";
  }
  return folly::to<std::string>(": ", reasonMessage(reason));
}

}  // anonymous namespace

std::string outcomeTrailer(
    Status status,
    folly::Optional<Reason> reason,
    double elapsed_sec) {
  return folly::to<std::string>(
    "PkgSweep ", dispositionWord(status), " after ",
    folly::format("{:.2f}", elapsed_sec).str(), "s", reasonSuffix(reason), "\n"
  );
}

std::string compilationTrailer(
    Status status,
    folly::Optional<Reason> reason) {
  return folly::to<std::string>(
    "Image compilation ", dispositionWord(status), reasonSuffix(reason), "\n"
  );
}

}}  // namespace facebook::pkgsweep
