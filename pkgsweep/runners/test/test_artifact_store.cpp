/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <boost/filesystem/operations.hpp>
#include <folly/experimental/TestUtil.h>
#include <folly/FileUtil.h>
#include <folly/ScopeGuard.h>
#include <gflags/gflags.h>

#include "pkgsweep/runners/ArtifactStore.h"

DECLARE_string(trace_upload_command);

using namespace facebook::pkgsweep;

TEST(TestArtifactStore, UploadByCommand) {
  folly::test::TemporaryDirectory tmp;
  auto file = (tmp.path() / "trace.tar.zst").string();
  ASSERT_TRUE(folly::writeFile(std::string("trace"), file.c_str()));
  auto store_dir = tmp.path() / "store";
  ASSERT_TRUE(boost::filesystem::create_directory(store_dir.string()));

  CommandArtifactStore store(
    {"cp", "{file}", store_dir.string() + "/{name}"}, "https://traces/"
  );
  EXPECT_EQ(
    "https://traces/Example-1.tar.zst", store.upload(file, "Example-1.tar.zst")
  );
  std::string s;
  EXPECT_TRUE(
    folly::readFile((store_dir / "Example-1.tar.zst").string().c_str(), s)
  );
  EXPECT_EQ("trace", s);
}

TEST(TestArtifactStore, FailedUpload) {
  CommandArtifactStore store({"sh", "-c", "echo denied 1>&2; exit 3"}, "");
  try {
    store.upload("/nonexistent", "x");
    FAIL() << "Expected the upload to throw";
  } catch (const std::exception& ex) {
    EXPECT_PCRE_MATCH(".*exited with status 3: denied", ex.what());
  }
  EXPECT_THROW(CommandArtifactStore({}, ""), std::runtime_error);
}

TEST(TestArtifactStore, FromFlags) {
  SCOPE_EXIT { FLAGS_trace_upload_command = ""; };
  FLAGS_trace_upload_command = "";
  EXPECT_FALSE(makeArtifactStoreFromFlags());

  FLAGS_trace_upload_command = R"(["cp", "{file}", "/tmp/{name}"])";
  EXPECT_TRUE(makeArtifactStoreFromFlags() != nullptr);

  FLAGS_trace_upload_command = R"({"cp": 1})";
  EXPECT_THROW(makeArtifactStoreFromFlags(), std::runtime_error);
  FLAGS_trace_upload_command = R"(["cp", 1])";
  EXPECT_THROW(makeArtifactStoreFromFlags(), std::runtime_error);
}
