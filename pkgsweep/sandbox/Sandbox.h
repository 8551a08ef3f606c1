/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace facebook { namespace pkgsweep {

class Configuration;

struct Mount {
  std::string hostPath;
  std::string target;  // Where the job sees it, if the sandbox remaps paths
  bool writable{false};
};

struct SandboxRequest {
  std::vector<std::string> args;  // Appended to the runtime command line
  std::map<std::string, std::string> env;
  std::vector<Mount> mounts;
  std::string workDir;  // Host directory owned by this job
};

struct SandboxCommand {
  std::vector<std::string> argv;
  std::vector<std::string> env;  // KEY=VALUE
  std::string chdir;  // Empty to inherit ours
};

/**
 * Turns a configuration plus one job's command line, environment and
 * mounts into a command for folly::Subprocess.  The supervisor owns the
 * resulting process: it makes it a process group leader and signals the
 * whole group, so a sandbox must not detach the runtime into another
 * process group.
 */
class Sandbox {
public:
  virtual ~Sandbox() {}

  virtual SandboxCommand prepare(
    const Configuration& config,
    const SandboxRequest& request
  ) const = 0;

  // The path at which the job sees `m`.
  virtual std::string visiblePath(const Mount& m) const = 0;

  virtual std::string name() const = 0;

protected:
  // The environment both sandboxes give the runtime: a minimal base, then
  // whitelisted variables of ours (--passthrough_env), then the
  // configuration's, then the request's.
  static std::vector<std::string> makeEnvironment(
    const Configuration& config,
    const SandboxRequest& request,
    const std::string& home
  );
};

// "local" or "bwrap", see --sandbox.
std::unique_ptr<Sandbox> makeSandbox(const std::string& type);

}}  // namespace facebook::pkgsweep
