/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/runners/ArtifactStore.h"

#include <boost/algorithm/string/replace.hpp>
#include <folly/json.h>
#include <folly/String.h>
#include <folly/Subprocess.h>
#include <gflags/gflags.h>
#include <glog/logging.h>

#include "pkgsweep/utils/Exception.h"

DEFINE_string(
  trace_upload_command, "",
  "JSON array with the command that uploads the recording of a crashed, "
  "traced job, e.g. [\"cp\", \"{file}\", \"/srv/traces/{name}\"].  If "
  "empty, recordings are not uploaded."
);
DEFINE_string(
  trace_url_prefix, "",
  "Prepended to the unique name of an uploaded recording to make its URL."
);

namespace facebook { namespace pkgsweep {

namespace fs = boost::filesystem;

CommandArtifactStore::CommandArtifactStore(
    std::vector<std::string> command,
    std::string url_prefix)
  : command_(std::move(command)), urlPrefix_(std::move(url_prefix)) {
  if (command_.empty()) {
    throw PkgSweepException("The upload command must not be empty");
  }
}

std::string CommandArtifactStore::upload(
    const fs::path& file,
    const std::string& name) const {
  auto argv = command_;
  for (auto& arg : argv) {
    boost::replace_all(arg, "{file}", file.native());
    boost::replace_all(arg, "{name}", name);
  }
  folly::Subprocess proc(
    argv,
    folly::Subprocess::Options().pipeStdout().pipeStderr().usePath()
  );
  auto output = proc.communicate();
  auto rc = proc.wait();
  if (!rc.exited() || rc.exitStatus() != 0) {
    throw PkgSweepException(
      "Upload command [", folly::join(", ", argv), "] ", rc.str(), ": ",
      folly::trimWhitespace(output.second)
    );
  }
  LOG(INFO) << "Uploaded " << file << " as " << name;
  return urlPrefix_ + name;
}

std::unique_ptr<ArtifactStore> makeArtifactStoreFromFlags() {
  if (FLAGS_trace_upload_command.empty()) {
    return nullptr;
  }
  auto d = folly::parseJson(FLAGS_trace_upload_command);
  if (!d.isArray()) {
    throw PkgSweepException("--trace_upload_command must be a JSON array");
  }
  std::vector<std::string> command;
  for (const auto& item : d) {
    if (!item.isString()) {
      throw PkgSweepException(
        "--trace_upload_command must only contain strings, got ",
        folly::toJson(item)
      );
    }
    command.emplace_back(item.getString());
  }
  return std::make_unique<CommandArtifactStore>(
    std::move(command), FLAGS_trace_url_prefix
  );
}

}}  // namespace facebook::pkgsweep
