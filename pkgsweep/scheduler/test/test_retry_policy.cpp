/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include "pkgsweep/scheduler/ResultTable.h"
#include "pkgsweep/scheduler/RetryPolicy.h"

using namespace facebook::pkgsweep;

namespace {

Outcome outcome(Status s, folly::Optional<Reason> r = folly::none) {
  Outcome o;
  o.status = s;
  o.reason = r;
  return o;
}

std::vector<std::string> lateRetries(
    const ResultTable& t,
    size_t num_configs) {
  return lateRetryConfigurations(t.rowsForPackage("Foo"), num_configs);
}

void add(
    ResultTable* t,
    const std::string& config,
    Status s,
    folly::Optional<Reason> r = folly::none) {
  t->append(ResultRow(config, "Foo", outcome(s, r)));
}

using Names = std::vector<std::string>;

}  // anonymous namespace

TEST(TestRetryPolicy, EarlyRetry) {
  auto crash = outcome(Status::Crash, Reason::Segfault);
  EXPECT_TRUE(shouldRetraceCrash(crash, TracingMode::EnabledOnRetry));
  EXPECT_FALSE(shouldRetraceCrash(crash, TracingMode::Enabled));
  EXPECT_FALSE(shouldRetraceCrash(crash, TracingMode::Disabled));
  EXPECT_FALSE(shouldRetraceCrash(
    outcome(Status::Fail, Reason::TestFailures), TracingMode::EnabledOnRetry
  ));

  EXPECT_TRUE(
    keepTracedOutcome(crash, outcome(Status::Crash, Reason::Segfault))
  );
  EXPECT_FALSE(
    keepTracedOutcome(crash, outcome(Status::Crash, Reason::Abort))
  );
  EXPECT_FALSE(keepTracedOutcome(crash, outcome(Status::Ok)));
}

TEST(TestRetryPolicy, SingleConfigurationRetriesEveryFailure) {
  ResultTable t;
  add(&t, "a", Status::Fail, Reason::TestFailures);
  EXPECT_EQ(Names{"a"}, lateRetries(t, 1));
}

TEST(TestRetryPolicy, WaitsForEveryConfiguration) {
  ResultTable t;
  add(&t, "a", Status::Fail, Reason::TestFailures);
  EXPECT_TRUE(lateRetries(t, 2).empty());
  add(&t, "b", Status::Ok);
  EXPECT_EQ(Names{"a"}, lateRetries(t, 2));
  // The retry's row does not trigger another round.
  add(&t, "a", Status::Fail, Reason::TestFailures);
  EXPECT_TRUE(lateRetries(t, 2).empty());
}

TEST(TestRetryPolicy, SomeConfigurationsFailed) {
  ResultTable t;
  add(&t, "a", Status::Ok);
  add(&t, "b", Status::Fail, Reason::TestFailures);
  add(&t, "c", Status::Fail, Reason::TestFailures);
  EXPECT_EQ((Names{"b", "c"}), lateRetries(t, 3));
}

TEST(TestRetryPolicy, IdenticalFailuresEverywhere) {
  ResultTable t;
  add(&t, "a", Status::Fail, Reason::TestFailures);
  add(&t, "b", Status::Fail, Reason::TestFailures);
  EXPECT_TRUE(lateRetries(t, 2).empty());
}

TEST(TestRetryPolicy, DifferentFailuresEverywhere) {
  ResultTable t;
  add(&t, "a", Status::Fail, Reason::TestFailures);
  add(&t, "b", Status::Fail, Reason::Network);
  EXPECT_EQ((Names{"a", "b"}), lateRetries(t, 2));
}

TEST(TestRetryPolicy, CrashesAndKillsAreNotRetried) {
  ResultTable t;
  add(&t, "a", Status::Crash, Reason::Abort);
  add(&t, "b", Status::Kill, Reason::TimeLimit);
  // Not every configuration "failed", but there is nothing to retry.
  EXPECT_TRUE(lateRetries(t, 2).empty());

  ResultTable t2;
  add(&t2, "a", Status::Ok);
  EXPECT_TRUE(lateRetries(t2, 1).empty());
}
