/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <folly/experimental/TestUtil.h>
#include <folly/ScopeGuard.h>
#include <gflags/gflags.h>
#include <sys/wait.h>

#include "pkgsweep/config/Configuration.h"
#include "pkgsweep/processes/ProcessSupervisor.h"
#include "pkgsweep/sandbox/LocalSandbox.h"
#include "pkgsweep/utils/CancellationToken.h"

DECLARE_int32(inactivity_first_check_ms);
DECLARE_int32(inactivity_check_interval_ms);
DECLARE_int32(kill_grace_period_ms);
DECLARE_int32(output_drain_timeout_ms);

using namespace facebook::pkgsweep;

namespace {

Configuration makeConfig(folly::dynamic extra = folly::dynamic::object) {
  folly::dynamic d = folly::dynamic::object("name", "test");
  d.update(extra);
  return Configuration(d);
}

struct TestProcessSupervisor : public ::testing::Test {
  ScriptResult run(
      const Configuration& config,
      std::string script,
      std::vector<std::string> args = {},
      const CancellationToken* cancel = nullptr) {
    ProcessSupervisor supervisor(&sandbox_, cancel);
    ScriptRequest req;
    req.script = std::move(script);
    req.args = std::move(args);
    req.workDir = tmp_.path().string();
    return supervisor.runScript(config, req);
  }

  LocalSandbox sandbox_;
  folly::test::TemporaryDirectory tmp_;
};

}  // anonymous namespace

TEST_F(TestProcessSupervisor, CleanExit) {
  auto res = run(makeConfig(), "echo hello");
  EXPECT_EQ(Status::Ok, res.status);
  EXPECT_FALSE(res.reason.has_value());
  EXPECT_EQ("hello\n", res.log);
}

TEST_F(TestProcessSupervisor, ArgsAndMergedStderr) {
  auto res = run(makeConfig(), "echo \"$1-$2\"; echo oops 1>&2", {"a", "b"});
  EXPECT_EQ(Status::Ok, res.status);
  EXPECT_EQ("a-b\noops\n", res.log);
}

TEST_F(TestProcessSupervisor, Environment) {
  ProcessSupervisor supervisor(&sandbox_);
  ScriptRequest req;
  req.script = "echo \"$GREETING $HOME\"";
  req.env["GREETING"] = "hi";
  req.workDir = tmp_.path().string();
  auto res = supervisor.runScript(
    makeConfig(folly::dynamic::object("env", folly::dynamic::object
      ("GREETING", "overridden")("OTHER", "x"))),
    req
  );
  EXPECT_EQ(Status::Ok, res.status);
  EXPECT_EQ("hi " + tmp_.path().string() + "\n", res.log);
}

TEST_F(TestProcessSupervisor, NonZeroExit) {
  auto res = run(makeConfig(), "echo bad; exit 3");
  EXPECT_EQ(Status::Fail, res.status);
  EXPECT_FALSE(res.reason.has_value());
  EXPECT_EQ("bad\n", res.log);
}

TEST_F(TestProcessSupervisor, ExitCodesOfSignals) {
  auto res = run(makeConfig(), "exit 134");
  EXPECT_EQ(Status::Crash, res.status);
  EXPECT_EQ(Reason::Abort, res.reason);

  res = run(makeConfig(), "exit 139");
  EXPECT_EQ(Status::Crash, res.status);
  EXPECT_EQ(Reason::Segfault, res.reason);

  res = run(makeConfig(), "exit 137");
  EXPECT_EQ(Status::Kill, res.status);
  EXPECT_EQ(Reason::ResourceLimit, res.reason);
}

TEST_F(TestProcessSupervisor, KilledBySignal) {
  auto res = run(makeConfig(), "kill -KILL $$");
  EXPECT_EQ(Status::Kill, res.status);
  EXPECT_EQ(Reason::ResourceLimit, res.reason);
}

TEST_F(TestProcessSupervisor, TimeLimit) {
  auto prev_grace = FLAGS_kill_grace_period_ms;
  FLAGS_kill_grace_period_ms = 1000;
  SCOPE_EXIT { FLAGS_kill_grace_period_ms = prev_grace; };

  auto start = std::chrono::steady_clock::now();
  auto res = run(
    makeConfig(folly::dynamic::object("time_limit_sec", 0.5)),
    "echo started; sleep 3600"
  );
  EXPECT_EQ(Status::Kill, res.status);
  EXPECT_EQ(Reason::TimeLimit, res.reason);
  EXPECT_EQ("started\n", res.log);
  EXPECT_GT(
    std::chrono::seconds(10), std::chrono::steady_clock::now() - start
  );
}

TEST_F(TestProcessSupervisor, TimeLimitIgnoringSigterm) {
  auto prev_grace = FLAGS_kill_grace_period_ms;
  FLAGS_kill_grace_period_ms = 500;
  SCOPE_EXIT { FLAGS_kill_grace_period_ms = prev_grace; };

  auto res = run(
    makeConfig(folly::dynamic::object("time_limit_sec", 0.3)),
    "trap '' TERM; while true; do sleep 1; done"
  );
  EXPECT_EQ(Status::Kill, res.status);
  EXPECT_EQ(Reason::TimeLimit, res.reason);
}

TEST_F(TestProcessSupervisor, TracingDoublesTheTimeLimit) {
  auto prev_grace = FLAGS_kill_grace_period_ms;
  FLAGS_kill_grace_period_ms = 500;
  SCOPE_EXIT { FLAGS_kill_grace_period_ms = prev_grace; };

  // Finishes within 2x, but not 1x, of the time limit.
  auto res = run(
    makeConfig(folly::dynamic::object
      ("time_limit_sec", 1)("tracing", "enabled")),
    "sleep 1.3; echo done"
  );
  EXPECT_EQ(Status::Ok, res.status);
  EXPECT_EQ("done\n", res.log);
}

TEST_F(TestProcessSupervisor, LogLimit) {
  auto res = run(
    makeConfig(folly::dynamic::object("log_limit_bytes", 1000)),
    "while true; do echo 0123456789abcdefghijklmnopqrstuvwxyz; done"
  );
  EXPECT_EQ(Status::Kill, res.status);
  EXPECT_EQ(Reason::LogLimit, res.reason);
  EXPECT_LE(res.log.size(), 1000);
  EXPECT_GT(res.log.size(), 900);
}

TEST_F(TestProcessSupervisor, LogTruncatedAfterExit) {
  // A single write past the limit, from a process that exits right away:
  // it may finish before the watchdog reacts, but the log stays bounded.
  auto res = run(
    makeConfig(folly::dynamic::object("log_limit_bytes", 10)),
    "echo 0123456789abcdefghijklmnopqrstuvwxyz"
  );
  EXPECT_TRUE(res.status == Status::Ok || res.status == Status::Kill);
  EXPECT_EQ("0123456789", res.log);
}

TEST_F(TestProcessSupervisor, Inactivity) {
  auto prev_first = FLAGS_inactivity_first_check_ms;
  auto prev_interval = FLAGS_inactivity_check_interval_ms;
  auto prev_grace = FLAGS_kill_grace_period_ms;
  FLAGS_inactivity_first_check_ms = 2500;
  FLAGS_inactivity_check_interval_ms = 500;
  FLAGS_kill_grace_period_ms = 500;
  SCOPE_EXIT {
    FLAGS_inactivity_first_check_ms = prev_first;
    FLAGS_inactivity_check_interval_ms = prev_interval;
    FLAGS_kill_grace_period_ms = prev_grace;
  };

  // Burn some CPU so that the samples are non-zero, then go idle.
  auto res = run(
    makeConfig(folly::dynamic::object("time_limit_sec", 60)),
    "end=$(($(date +%s) + 2)); "
    "while [ $(date +%s) -lt $end ]; do :; done; "
    "sleep 3600"
  );
  EXPECT_EQ(Status::Kill, res.status);
  EXPECT_EQ(Reason::Inactivity, res.reason);
}

TEST_F(TestProcessSupervisor, Cancelled) {
  auto prev_grace = FLAGS_kill_grace_period_ms;
  FLAGS_kill_grace_period_ms = 500;
  SCOPE_EXIT { FLAGS_kill_grace_period_ms = prev_grace; };

  CancellationToken cancel;
  EXPECT_TRUE(cancel.cancel());
  EXPECT_FALSE(cancel.cancel());
  auto res = run(makeConfig(), "sleep 3600", {}, &cancel);
  EXPECT_EQ(Status::Kill, res.status);
  EXPECT_FALSE(res.reason.has_value());
}

TEST_F(TestProcessSupervisor, OrphanHoldsOutput) {
  auto prev_drain = FLAGS_output_drain_timeout_ms;
  FLAGS_output_drain_timeout_ms = 200;
  SCOPE_EXIT { FLAGS_output_drain_timeout_ms = prev_drain; };

  auto start = std::chrono::steady_clock::now();
  auto res = run(makeConfig(), "sleep 5 & echo parent");
  EXPECT_EQ(Status::Ok, res.status);
  EXPECT_EQ("parent\n", res.log);
  EXPECT_GT(
    std::chrono::seconds(4), std::chrono::steady_clock::now() - start
  );
}

TEST_F(TestProcessSupervisor, CannotStart) {
  auto res = run(
    makeConfig(folly::dynamic::object
      ("runtime", folly::dynamic::array("/pkgsweep/does/not/exist"))),
    "echo unreachable"
  );
  EXPECT_EQ(Status::Fail, res.status);
  EXPECT_FALSE(res.reason.has_value());
  EXPECT_PCRE_MATCH(
    "Failed to start /pkgsweep/does/not/exist: [\\s\\S]*", res.log
  );
}

TEST(TestClassifyExit, ExitCodesAndSignals) {
  auto check = [](int wait_status, Status s, folly::Optional<Reason> r) {
    auto res = classifyExit(folly::ProcessReturnCode::make(wait_status));
    EXPECT_EQ(s, res.first);
    EXPECT_EQ(r, res.second);
  };
  check(W_EXITCODE(0, 0), Status::Ok, folly::none);
  check(W_EXITCODE(1, 0), Status::Fail, folly::none);
  check(W_EXITCODE(134, 0), Status::Crash, Reason::Abort);
  check(W_EXITCODE(139, 0), Status::Crash, Reason::Segfault);
  check(W_EXITCODE(137, 0), Status::Kill, Reason::ResourceLimit);
  check(W_EXITCODE(143, 0), Status::Fail, folly::none);  // SIGTERM
  check(W_EXITCODE(0, SIGABRT), Status::Crash, Reason::Abort);
  check(W_EXITCODE(0, SIGSEGV), Status::Crash, Reason::Segfault);
  check(W_EXITCODE(0, SIGKILL), Status::Kill, Reason::ResourceLimit);
  check(W_EXITCODE(0, SIGTERM), Status::Fail, folly::none);
}
