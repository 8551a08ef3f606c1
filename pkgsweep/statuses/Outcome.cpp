/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/statuses/Outcome.h"

#include <glog/logging.h>

#include "pkgsweep/utils/Exception.h"

namespace facebook { namespace pkgsweep {

const std::vector<ReasonInfo> kReasonTable{
  {Reason::Abort, Status::Crash, "abort", "the process was aborted"},
  {Reason::Internal, Status::Crash, "internal",
    "an internal error was encountered"},
  {Reason::Unreachable, Status::Crash, "unreachable",
    "an unreachable instruction was executed"},
  {Reason::GCCorruption, Status::Crash, "gc_corruption",
    "GC corruption was detected"},
  {Reason::Segfault, Status::Crash, "segfault",
    "a segmentation fault happened"},

  {Reason::Syntax, Status::Fail, "syntax", "package has syntax issues"},
  {Reason::Uncompilable, Status::Fail, "uncompilable",
    "compilation of the package failed"},
  {Reason::TestFailures, Status::Fail, "test_failures",
    "package has test failures"},
  {Reason::BinaryDependency, Status::Fail, "binary_dependency",
    "package requires a missing binary dependency"},
  {Reason::MissingDependency, Status::Fail, "missing_dependency",
    "package is missing a package dependency"},
  {Reason::MissingPackage, Status::Fail, "missing_package",
    "package is using an unknown package"},
  {Reason::Network, Status::Fail, "network",
    "networking-related issues were detected"},
  {Reason::Unknown, Status::Fail, "unknown",
    "there were unidentified errors"},

  {Reason::Inactivity, Status::Kill, "inactivity", "tests became inactive"},
  {Reason::TimeLimit, Status::Kill, "time_limit",
    "test duration exceeded the time limit"},
  {Reason::LogLimit, Status::Kill, "log_limit",
    "test log exceeded the size limit"},
  {Reason::ResourceLimit, Status::Kill, "resource_limit",
    "test process exceeded a resource limit"},

  {Reason::Untestable, Status::Skip, "untestable",
    "package does not have any tests"},
  {Reason::Uninstallable, Status::Skip, "uninstallable",
    "package could not be installed"},
  {Reason::Unsupported, Status::Skip, "unsupported",
    "package is not supported by this runtime version"},
  {Reason::Blacklisted, Status::Skip, "blacklisted",
    "package was blacklisted"},
};

namespace {

struct StatusInfo {
  Status status;
  folly::StringPiece name;
  folly::StringPiece message;
};

const StatusInfo kStatuses[] = {
  {Status::Ok, "ok", "successful"},
  {Status::Skip, "skip", "skipped"},
  {Status::Fail, "fail", "unsuccessful"},
  {Status::Kill, "kill", "interrupted"},
  {Status::Crash, "crash", "crashed"},
};

const StatusInfo& findStatus(Status s) {
  for (const auto& info : kStatuses) {
    if (info.status == s) {
      return info;
    }
  }
  LOG(FATAL) << "Unknown status " << static_cast<int>(s);
}

const ReasonInfo* findReason(Reason r) {
  for (const auto& info : kReasonTable) {
    if (info.reason == r) {
      return &info;
    }
  }
  return nullptr;
}

}  // anonymous namespace

folly::StringPiece statusName(Status s) {
  return findStatus(s).name;
}

folly::StringPiece statusMessage(Status s) {
  return findStatus(s).message;
}

Status statusFromName(folly::StringPiece name) {
  for (const auto& info : kStatuses) {
    if (info.name == name) {
      return info.status;
    }
  }
  throw PkgSweepException("Unknown status: ", name);
}

folly::StringPiece reasonName(Reason r) {
  const auto* info = findReason(r);
  CHECK(info) << "Reason " << static_cast<int>(r) << " is not in the table";
  return info->name;
}

Reason reasonFromName(folly::StringPiece name) {
  for (const auto& info : kReasonTable) {
    if (info.name == name) {
      return info.reason;
    }
  }
  throw PkgSweepException("Unknown reason: ", name);
}

Status reasonStatus(Reason r) {
  const auto* info = findReason(r);
  CHECK(info) << "Reason " << static_cast<int>(r) << " is not in the table";
  return info->status;
}

std::string reasonMessage(folly::Optional<Reason> r) {
  if (r.has_value()) {
    if (const auto* info = findReason(*r)) {
      return info->message.str();
    }
  }
  return "unknown reason";
}

size_t reasonSeverity(folly::Optional<Reason> r) {
  if (r.has_value()) {
    for (size_t i = 0; i < kReasonTable.size(); ++i) {
      if (kReasonTable[i].reason == *r) {
        return i;
      }
    }
  }
  return kUnknownReasonSeverity;
}

}}  // namespace facebook::pkgsweep
