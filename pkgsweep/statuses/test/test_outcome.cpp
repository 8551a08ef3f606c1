/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <set>

#include "pkgsweep/statuses/Outcome.h"

using namespace facebook::pkgsweep;

TEST(TestOutcome, ReasonTableIsOrderedByStatus) {
  // crash, then fail, then kill, then skip
  const std::vector<Status> kOrder{
    Status::Crash, Status::Fail, Status::Kill, Status::Skip
  };
  size_t group = 0;
  std::set<folly::StringPiece> names;
  for (const auto& info : kReasonTable) {
    while (group < kOrder.size() && kOrder[group] != info.status) {
      ++group;
    }
    ASSERT_LT(group, kOrder.size()) << info.name;
    EXPECT_TRUE(names.insert(info.name).second) << info.name;
    EXPECT_EQ(info.status, reasonStatus(info.reason));
    EXPECT_EQ(info.reason, reasonFromName(info.name));
  }
  EXPECT_EQ(21U, kReasonTable.size());
}

TEST(TestOutcome, Severity) {
  EXPECT_EQ(0U, reasonSeverity(Reason::Abort));
  EXPECT_LT(reasonSeverity(Reason::Internal), reasonSeverity(Reason::Segfault));
  EXPECT_LT(reasonSeverity(Reason::Segfault), reasonSeverity(Reason::Syntax));
  EXPECT_LT(
    reasonSeverity(Reason::Network), reasonSeverity(Reason::Unknown)
  );
  EXPECT_LT(
    reasonSeverity(Reason::Blacklisted), reasonSeverity(folly::none)
  );
  EXPECT_EQ(kUnknownReasonSeverity, reasonSeverity(folly::none));
}

TEST(TestOutcome, Names) {
  EXPECT_EQ("kill", statusName(Status::Kill));
  EXPECT_EQ("interrupted", statusMessage(Status::Kill));
  EXPECT_EQ(Status::Crash, statusFromName("crash"));
  EXPECT_THROW(statusFromName("exploded"), std::runtime_error);

  EXPECT_EQ("time_limit", reasonName(Reason::TimeLimit));
  EXPECT_EQ(Reason::GCCorruption, reasonFromName("gc_corruption"));
  EXPECT_THROW(reasonFromName("cosmic_rays"), std::runtime_error);

  EXPECT_EQ("package has test failures", reasonMessage(Reason::TestFailures));
  EXPECT_EQ("unknown reason", reasonMessage(folly::none));
}

TEST(TestOutcome, SameClassification) {
  Outcome a;
  a.status = Status::Crash;
  a.reason = Reason::Abort;
  a.log = "first";
  Outcome b = a;
  b.log = "second";
  b.duration = 3.0;
  EXPECT_TRUE(a.sameClassification(b));
  b.reason = Reason::Segfault;
  EXPECT_FALSE(a.sameClassification(b));
  b.reason = folly::none;
  EXPECT_FALSE(a.sameClassification(b));
}
