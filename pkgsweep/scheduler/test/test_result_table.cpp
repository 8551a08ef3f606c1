/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <folly/experimental/TestUtil.h>
#include <folly/FileUtil.h>
#include <folly/json.h>
#include <unistd.h>

#include "pkgsweep/scheduler/ResultTable.h"

using namespace facebook::pkgsweep;

namespace {

ResultRow row(
    const std::string& config,
    const std::string& package,
    Status status,
    folly::Optional<Reason> reason = folly::none) {
  Outcome o;
  o.status = status;
  o.reason = reason;
  o.log = config + "/" + package;
  o.version = "1.0.0";
  o.duration = 2.5;
  return ResultRow(config, package, o);
}

}  // anonymous namespace

TEST(TestResultTable, Deduplicate) {
  ResultTable t;
  t.append(row("a", "Foo", Status::Fail, Reason::TestFailures));
  t.append(row("b", "Foo", Status::Ok));
  t.append(row("a", "Bar", Status::Ok));
  t.append(row("a", "Foo", Status::Ok));  // A late retry of the first row
  EXPECT_EQ(4U, t.size());
  EXPECT_EQ(1U, t.count(Status::Fail));
  EXPECT_EQ(3U, t.rowsForPackage("Foo").size());

  EXPECT_EQ(1U, t.deduplicate());
  ASSERT_EQ(3U, t.size());
  // The retry replaced the first attempt in place.
  EXPECT_EQ("a", t.rows()[0].configuration);
  EXPECT_EQ("Foo", t.rows()[0].package);
  EXPECT_EQ(Status::Ok, t.rows()[0].status);
  EXPECT_FALSE(t.rows()[0].reason.has_value());
  EXPECT_EQ("b", t.rows()[1].configuration);
  EXPECT_EQ("Bar", t.rows()[2].package);
  EXPECT_EQ(0U, t.count(Status::Fail));

  EXPECT_EQ(0U, t.deduplicate());
}

TEST(TestResultTable, ToDynamic) {
  ResultTable t;
  t.append(row("a", "Foo", Status::Fail, Reason::Network));
  t.append(ResultRow::skip("a", "Gurobi", Reason::Blacklisted));
  EXPECT_EQ(folly::parseJson(R"JSON([
    {"configuration": "a", "package": "Foo", "version": "1.0.0",
     "status": "fail", "reason": "network", "duration": 2.5,
     "log": "a/Foo"},
    {"configuration": "a", "package": "Gurobi", "version": null,
     "status": "skip", "reason": "blacklisted", "duration": 0.0,
     "log": null}
  ])JSON"), t.toDynamic());
}

TEST(TestResultTable, OkHasNullReason) {
  EXPECT_TRUE(row("a", "Foo", Status::Ok).toDynamic()["reason"].isNull());
}

TEST(TestResultTable, WriteResults) {
  ResultTable t;
  t.append(row("a", "Foo", Status::Ok));
  folly::test::TemporaryDirectory tmp;
  auto path = (tmp.path() / "results.json").string();
  writeResults(t, path);
  std::string s;
  ASSERT_TRUE(folly::readFile(path.c_str(), s));
  EXPECT_EQ(t.toDynamic(), folly::parseJson(s));

  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  writeResults(t, fds[1]);
  ::close(fds[1]);
  std::string piped;
  ASSERT_TRUE(folly::readFile(fds[0], piped));
  ::close(fds[0]);
  EXPECT_EQ(s, piped);
}

TEST(TestResultTable, WriteErrorsThrow) {
  ResultTable t;
  t.append(row("a", "Foo", Status::Ok));
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  ::close(fds[1]);
  // Writing to the closed descriptor fails with EBADF.
  EXPECT_THROW(writeResults(t, fds[1]), std::runtime_error);
  ::close(fds[0]);
  EXPECT_THROW(
    writeResults(t, std::string("/nonexistent/dir/results.json")),
    std::runtime_error
  );
}
