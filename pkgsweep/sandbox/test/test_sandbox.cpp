/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <folly/dynamic.h>
#include <gflags/gflags.h>

#include "pkgsweep/config/Configuration.h"
#include "pkgsweep/sandbox/BubblewrapSandbox.h"
#include "pkgsweep/sandbox/LocalSandbox.h"

DECLARE_string(bwrap);
DECLARE_string(passthrough_env);
DECLARE_string(taskset);

using namespace facebook::pkgsweep;

namespace {

Configuration makeConfig(const std::string& rootfs) {
  return Configuration(folly::dynamic::object
    ("name", "stable")
    ("runtime", folly::dynamic::array("/bin/julia", "-"))
    ("runtime_flags", folly::dynamic::array("--color=no"))
    ("rootfs", rootfs)
    ("env", folly::dynamic::object("FROM_CONFIG", "1")("SHARED", "config")));
}

SandboxRequest makeRequest() {
  SandboxRequest r;
  r.args = {"{\"name\":\"Example\"}"};
  r.env = {{"SHARED", "request"}};
  r.mounts = {{"/host/out", "/output", true}, {"/host/cache", "/cache", false}};
  r.workDir = "/host/work";
  return r;
}

bool hasEnv(const SandboxCommand& cmd, const std::string& kv) {
  return std::find(cmd.env.begin(), cmd.env.end(), kv) != cmd.env.end();
}

}  // anonymous namespace

TEST(TestSandbox, Local) {
  LocalSandbox sandbox;
  EXPECT_EQ("local", sandbox.name());
  auto cmd = sandbox.prepare(makeConfig(""), makeRequest());
  EXPECT_EQ(
    (std::vector<std::string>{
      "/bin/julia", "-", "--color=no", "{\"name\":\"Example\"}"
    }),
    cmd.argv
  );
  EXPECT_EQ("/host/work", cmd.chdir);
  EXPECT_TRUE(hasEnv(cmd, "HOME=/host/work"));
  EXPECT_TRUE(hasEnv(cmd, "USER=pkgsweep"));
  EXPECT_TRUE(hasEnv(cmd, "FROM_CONFIG=1"));
  // The request overrides the configuration.
  EXPECT_TRUE(hasEnv(cmd, "SHARED=request"));
  EXPECT_FALSE(hasEnv(cmd, "SHARED=config"));
  EXPECT_EQ("/host/out", sandbox.visiblePath(makeRequest().mounts[0]));
}

TEST(TestSandbox, PassthroughEnvironment) {
  gflags::FlagSaver saver;
  FLAGS_passthrough_env = "PKGSWEEP_TEST_PASSTHROUGH,PKGSWEEP_TEST_UNSET";
  ASSERT_EQ(0, ::setenv("PKGSWEEP_TEST_PASSTHROUGH", "yes", 1));
  ::unsetenv("PKGSWEEP_TEST_UNSET");
  ASSERT_EQ(0, ::setenv("PKGSWEEP_TEST_PRIVATE", "no", 1));
  auto cmd = LocalSandbox().prepare(makeConfig(""), makeRequest());
  EXPECT_TRUE(hasEnv(cmd, "PKGSWEEP_TEST_PASSTHROUGH=yes"));
  for (const auto& kv : cmd.env) {
    EXPECT_NE(0U, kv.find("PKGSWEEP_TEST_UNSET"));
    EXPECT_NE(0U, kv.find("PKGSWEEP_TEST_PRIVATE"));
  }
}

TEST(TestSandbox, Bubblewrap) {
  gflags::FlagSaver saver;
  FLAGS_bwrap = "/opt/bwrap";
  FLAGS_taskset = "/opt/taskset";
  BubblewrapSandbox sandbox;
  EXPECT_EQ("bwrap", sandbox.name());
  EXPECT_THROW(
    sandbox.prepare(makeConfig(""), makeRequest()), std::runtime_error
  );

  Configuration::Overrides o;
  o.cpus = std::vector<int>{3};
  auto cmd = sandbox.prepare(makeConfig("/srv/rootfs").with(o), makeRequest());
  EXPECT_EQ(
    (std::vector<std::string>{
      "/opt/taskset", "--cpu-list", "3",
      "/opt/bwrap",
      "--unshare-user", "--unshare-pid", "--unshare-ipc", "--unshare-uts",
      "--uid", "1000", "--gid", "1000",
      "--ro-bind", "/srv/rootfs", "/",
      "--dev", "/dev", "--proc", "/proc", "--tmpfs", "/tmp",
      "--dir", "/home/pkgsweep",
      "--bind", "/host/out", "/output",
      "--ro-bind", "/host/cache", "/cache",
      "--chdir", "/home/pkgsweep", "--",
      "/bin/julia", "-", "--color=no", "{\"name\":\"Example\"}",
    }),
    cmd.argv
  );
  EXPECT_TRUE(hasEnv(cmd, "HOME=/home/pkgsweep"));
  EXPECT_EQ("/host/work", cmd.chdir);
  EXPECT_EQ("/output", sandbox.visiblePath(makeRequest().mounts[0]));
}

TEST(TestSandbox, MakeSandbox) {
  EXPECT_EQ("local", makeSandbox("local")->name());
  EXPECT_EQ("bwrap", makeSandbox("bwrap")->name());
  EXPECT_THROW(makeSandbox("docker"), std::runtime_error);
}
