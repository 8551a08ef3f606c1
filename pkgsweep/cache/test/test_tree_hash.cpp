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
#include <sys/types.h>

#include "pkgsweep/cache/TreeHash.h"
#include "pkgsweep/utils/TemporaryDir.h"

using namespace facebook::pkgsweep;
namespace fs = boost::filesystem;

namespace {

void writeFile(const fs::path& p, const std::string& s) {
  fs::create_directories(p.parent_path());
  CHECK(folly::writeFile(s, p.c_str()));
}

}  // anonymous namespace

TEST(TestTreeHash, ParseSha1) {
  auto sha = parseSha1("E69DE29BB2D1D6434B8B29AE775AD8C2E48C5391");
  ASSERT_TRUE(sha.has_value());
  EXPECT_EQ("e69de29bb2d1d6434b8b29ae775ad8c2e48c5391", sha1Hex(*sha));
  // Too short, and not hex
  EXPECT_FALSE(parseSha1("e69de29bb2d1d6434b8b29ae775ad8c2e48c539"));
  EXPECT_FALSE(parseSha1("g69de29bb2d1d6434b8b29ae775ad8c2e48c5391"));
  EXPECT_FALSE(parseSha1("not-a-hash"));
  EXPECT_FALSE(parseSha1(""));
}

TEST(TestTreeHash, GitObjects) {
  EXPECT_EQ(
    "e69de29bb2d1d6434b8b29ae775ad8c2e48c5391",
    sha1Hex(gitObjectHash("blob", folly::ByteRange()))
  );
  EXPECT_EQ(
    "4b825dc642cb6eb9a060e54bf8d69288fbee4904",
    sha1Hex(gitObjectHash("tree", folly::ByteRange()))
  );
  folly::StringPiece hello = "hello\n";
  EXPECT_EQ(
    "ce013625030ba8dba906f756967f9e9ca394464a",
    sha1Hex(gitObjectHash("blob", folly::ByteRange(hello)))
  );
}

// Matches `git write-tree` for the same files.
TEST(TestTreeHash, MatchesGit) {
  TemporaryDir tmp;
  auto root = tmp.getPath() / "tree";
  writeFile(root / "a.txt", "hello\n");
  writeFile(root / "run.sh", "#!/bin/sh\n");
  fs::permissions(root / "run.sh", fs::add_perms | fs::owner_exe);
  writeFile(root / "sub" / "b", "b\n");
  writeFile(root / "foo" / "x", "x");  // "foo/" sorts after "foo.txt"
  writeFile(root / "foo.txt", "y");
  fs::create_symlink("a.txt", root / "link");
  fs::create_directories(root / "empty" / "nested");  // Left out
  EXPECT_TRUE(isHashable(root));
  EXPECT_EQ(
    "298ac173d8244feb1b8a1cc9f586f5f7ebbbc626", sha1Hex(treeHash(root))
  );

  auto small = tmp.getPath() / "small";
  writeFile(small / "sub" / "b", "b\n");
  EXPECT_EQ(
    "e7da8f1391da5ebc66501748b8d700a420da6dcb", sha1Hex(treeHash(small))
  );
}

TEST(TestTreeHash, ContentChangesHash) {
  TemporaryDir tmp;
  writeFile(tmp.getPath() / "d" / "f", "one");
  auto before = treeHash(tmp.getPath() / "d");
  writeFile(tmp.getPath() / "d" / "f", "two");
  EXPECT_NE(before, treeHash(tmp.getPath() / "d"));
}

TEST(TestTreeHash, Hashable) {
  TemporaryDir tmp;
  auto root = tmp.getPath();
  writeFile(root / "good" / "file", "x");
  fs::create_symlink("/nonexistent/target", root / "good" / "dangling");
  EXPECT_TRUE(isHashable(root / "good"));
  EXPECT_TRUE(isHashable(root / "good" / "file"));
  EXPECT_TRUE(isHashable(root / "good" / "dangling"));

  writeFile(root / "bad" / "file", "x");
  fs::create_directories(root / "bad" / "sub");
  ASSERT_EQ(0, ::mkfifo((root / "bad" / "sub" / "fifo").c_str(), 0600));
  EXPECT_FALSE(isHashable(root / "bad"));
  EXPECT_FALSE(isHashable(root / "bad" / "sub" / "fifo"));
  EXPECT_THROW(treeHash(root / "bad"), std::runtime_error);

  EXPECT_FALSE(isHashable(root / "missing"));
}
