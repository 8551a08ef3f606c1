/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <folly/experimental/TestUtil.h>
#include <folly/FileUtil.h>

#include "pkgsweep/runners/SideChannel.h"

using namespace facebook::pkgsweep;

namespace {

struct TestSideChannel : public ::testing::Test {
  void write(const std::string& entry, const std::string& s) {
    auto path = (tmp_.path() / entry).string();
    ASSERT_TRUE(folly::writeFile(s, path.c_str()));
  }

  SideChannel read() {
    return readSideChannel(tmp_.path().string(), "Example", "stable");
  }

  folly::test::TemporaryDirectory tmp_;
};

}  // anonymous namespace

TEST_F(TestSideChannel, Defaults) {
  auto sc = read();
  EXPECT_FALSE(sc.installed);
  EXPECT_FALSE(sc.version.has_value());
  EXPECT_EQ(0.0, sc.duration);
}

TEST_F(TestSideChannel, Values) {
  write("installed", "true\n");
  write("version", "1.2.3\n");
  write("duration", "12.5");
  auto sc = read();
  EXPECT_TRUE(sc.installed);
  EXPECT_EQ("1.2.3", sc.version.value());
  EXPECT_EQ(12.5, sc.duration);

  write("installed", "false");
  write("version", "v\"0.1.0-DEV\"");
  write("duration", "0");
  sc = read();
  EXPECT_FALSE(sc.installed);
  EXPECT_EQ("0.1.0-DEV", sc.version.value());
  EXPECT_EQ(0.0, sc.duration);
}

TEST_F(TestSideChannel, Unversioned) {
  write("installed", "true");
  write("version", "nothing");
  auto sc = read();
  EXPECT_TRUE(sc.installed);
  EXPECT_FALSE(sc.version.has_value());
}

TEST_F(TestSideChannel, GarbageYieldsDefaults) {
  write("installed", "yes please");
  write("version", "1.2 3");
  write("duration", "fast");
  auto sc = read();
  EXPECT_FALSE(sc.installed);
  EXPECT_FALSE(sc.version.has_value());
  EXPECT_EQ(0.0, sc.duration);

  write("version", "v\"1.2.3");
  write("duration", "-1");
  sc = read();
  EXPECT_FALSE(sc.version.has_value());
  EXPECT_EQ(0.0, sc.duration);
}
