/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <boost/filesystem.hpp>
#include <folly/FileUtil.h>
#include <glog/logging.h>
#include <sys/stat.h>

#include "pkgsweep/cache/CacheManager.h"
#include "pkgsweep/config/Configuration.h"

using namespace facebook::pkgsweep;
namespace fs = boost::filesystem;

namespace {

void writeFile(const fs::path& p, const std::string& s) {
  fs::create_directories(p.parent_path());
  CHECK(folly::writeFile(s, p.c_str()));
}

std::string readFile(const fs::path& p) {
  std::string s;
  CHECK(folly::readFile(p.c_str(), s));
  return s;
}

}  // anonymous namespace

TEST(TestCacheManager, Layout) {
  TemporaryDir tmp;
  CacheManager cm(tmp.getPath() / "storage");
  EXPECT_TRUE(fs::is_directory(cm.packagesDir()));
  EXPECT_TRUE(fs::is_directory(cm.artifactsDir()));
  EXPECT_TRUE(fs::is_directory(cm.storageDir() / "compiled"));
}

TEST(TestCacheManager, CompiledDirsByIdentity) {
  TemporaryDir tmp;
  fs::path a_dir;
  {
    CacheManager cm(tmp.getPath());
    Configuration a(folly::dynamic::object("name", "a/1")("uid", 1000));
    // Same identity, different name and limits: shares a's cache.
    Configuration a2(folly::dynamic::object
      ("name", "a2")("uid", 1000)("time_limit_sec", 5));
    Configuration b(folly::dynamic::object("name", "b")("uid", 1001));

    a_dir = cm.compiledDir(a);
    EXPECT_TRUE(fs::is_directory(a_dir));
    EXPECT_EQ(tmp.getPath() / "compiled", a_dir.parent_path());
    EXPECT_EQ(a_dir, cm.compiledDir(a2));
    auto b_dir = cm.compiledDir(b);
    EXPECT_NE(a_dir, b_dir);

    fs::remove_all(a_dir);
    auto new_a_dir = cm.compiledDir(a);
    EXPECT_NE(a_dir, new_a_dir);
    EXPECT_TRUE(fs::is_directory(new_a_dir));
    a_dir = new_a_dir;
  }
  EXPECT_FALSE(fs::exists(a_dir));  // Cleaned up with the manager
}

TEST(TestCacheManager, CopyBack) {
  TemporaryDir tmp;
  CacheManager cm(tmp.getPath() / "storage");
  auto src = tmp.getPath() / "local";
  auto dst = cm.packagesDir();

  writeFile(dst / "Old" / "Abcd1" / "file", "old");
  writeFile(dst / "Shared" / "Abcd1" / "file", "stale");
  writeFile(tmp.getPath() / "outside", "outside");
  fs::create_symlink(tmp.getPath() / "outside", dst / "Shared" / "link");

  writeFile(src / "New" / "Wxyz1" / "src" / "New.jl", "new");
  fs::permissions(src / "New" / "Wxyz1" / "src" / "New.jl", fs::owner_read);
  writeFile(src / "Shared" / "Abcd1" / "file", "fresh");
  writeFile(src / "Shared" / "link", "replaces the symlink");
  fs::create_symlink("file", src / "Shared" / "Abcd1" / "alias");
  ASSERT_EQ(0, ::mkfifo((src / "Shared" / "fifo").c_str(), 0600));

  EXPECT_EQ(0, cm.copyBack(src, dst));

  EXPECT_EQ("old", readFile(dst / "Old" / "Abcd1" / "file"));
  EXPECT_EQ("new", readFile(dst / "New" / "Wxyz1" / "src" / "New.jl"));
  EXPECT_EQ(
    fs::owner_read,
    fs::status(dst / "New" / "Wxyz1" / "src" / "New.jl").permissions()
  );
  EXPECT_EQ("fresh", readFile(dst / "Shared" / "Abcd1" / "file"));
  EXPECT_TRUE(fs::is_symlink(dst / "Shared" / "Abcd1" / "alias"));
  EXPECT_EQ("file", fs::read_symlink(dst / "Shared" / "Abcd1" / "alias"));
  // Replaced, never written through.
  EXPECT_FALSE(fs::is_symlink(dst / "Shared" / "link"));
  EXPECT_EQ("replaces the symlink", readFile(dst / "Shared" / "link"));
  EXPECT_EQ("outside", readFile(tmp.getPath() / "outside"));
  EXPECT_FALSE(fs::exists(fs::symlink_status(dst / "Shared" / "fifo")));

  // A missing source is nothing to merge.
  EXPECT_EQ(0, cm.copyBack(tmp.getPath() / "nope", dst));
}
