/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/sandbox/BubblewrapSandbox.h"

#include <folly/Conv.h>
#include <folly/String.h>
#include <gflags/gflags.h>

#include "pkgsweep/config/Configuration.h"
#include "pkgsweep/utils/Exception.h"

DEFINE_string(bwrap, "/usr/bin/bwrap", "The bubblewrap launcher binary.");
DEFINE_string(
  taskset, "/usr/bin/taskset",
  "Used to pin sandboxed jobs to the CPUs of their configuration."
);

namespace facebook { namespace pkgsweep {

SandboxCommand BubblewrapSandbox::prepare(
    const Configuration& config,
    const SandboxRequest& request) const {
  if (config.rootfs.empty()) {
    throw PkgSweepException(
      "Configuration '", config.name, "' needs a rootfs to run under bwrap"
    );
  }
  SandboxCommand cmd;
  if (!config.cpus.empty()) {
    cmd.argv = {FLAGS_taskset, "--cpu-list", folly::join(',', config.cpus)};
  }
  cmd.argv.insert(cmd.argv.end(), {
    FLAGS_bwrap,
    "--unshare-user", "--unshare-pid", "--unshare-ipc", "--unshare-uts",
    "--uid", folly::to<std::string>(config.uid),
    "--gid", folly::to<std::string>(config.gid),
    "--ro-bind", config.rootfs, "/",
    "--dev", "/dev",
    "--proc", "/proc",
    "--tmpfs", "/tmp",
    "--dir", config.home,
  });
  for (const auto& m : request.mounts) {
    cmd.argv.insert(cmd.argv.end(), {
      m.writable ? "--bind" : "--ro-bind", m.hostPath, m.target
    });
  }
  cmd.argv.insert(cmd.argv.end(), {"--chdir", config.home, "--"});
  cmd.argv.insert(cmd.argv.end(), config.runtime.begin(), config.runtime.end());
  cmd.argv.insert(
    cmd.argv.end(), config.runtimeFlags.begin(), config.runtimeFlags.end()
  );
  cmd.argv.insert(cmd.argv.end(), request.args.begin(), request.args.end());
  cmd.env = makeEnvironment(config, request, config.home);
  cmd.chdir = request.workDir;
  return cmd;
}

}}  // namespace facebook::pkgsweep
