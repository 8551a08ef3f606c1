/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/sandbox/LocalSandbox.h"

#include "pkgsweep/config/Configuration.h"

namespace facebook { namespace pkgsweep {

SandboxCommand LocalSandbox::prepare(
    const Configuration& config,
    const SandboxRequest& request) const {
  SandboxCommand cmd;
  cmd.argv = config.runtime;
  cmd.argv.insert(
    cmd.argv.end(), config.runtimeFlags.begin(), config.runtimeFlags.end()
  );
  cmd.argv.insert(cmd.argv.end(), request.args.begin(), request.args.end());
  cmd.env = makeEnvironment(config, request, request.workDir);
  cmd.chdir = request.workDir;
  return cmd;
}

}}  // namespace facebook::pkgsweep
