/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <memory>
#include <string>
#include <vector>

namespace facebook { namespace pkgsweep {

/**
 * Somewhere to publish debug artifacts, such as the tracer recordings of
 * crashed jobs, so that they outlive the job's working directory.
 */
class ArtifactStore {
public:
  virtual ~ArtifactStore() {}

  // Publishes `file` under the unique `name`, and returns its URL.  Must
  // be thread-safe.  Throws on failure.
  virtual std::string upload(
    const boost::filesystem::path& file,
    const std::string& name
  ) const = 0;
};

/**
 * Uploads by running a command, in which the arguments "{file}" and
 * "{name}" are replaced by the file's path and unique name.  The URL is
 * `url_prefix` followed by the name.
 *
 *   CommandArtifactStore(
 *     {"s5cmd", "cp", "-acl", "public-read", "{file}", "s3://traces/{name}"},
 *     "https://traces.s3.amazonaws.com/"
 *   )
 */
class CommandArtifactStore : public ArtifactStore {
public:
  CommandArtifactStore(std::vector<std::string> command, std::string url_prefix);

  std::string upload(
    const boost::filesystem::path& file,
    const std::string& name
  ) const override;

private:
  const std::vector<std::string> command_;
  const std::string urlPrefix_;
};

// From --trace_upload_command and --trace_url_prefix, or nullptr if no
// command is set.
std::unique_ptr<ArtifactStore> makeArtifactStoreFromFlags();

}}  // namespace facebook::pkgsweep
