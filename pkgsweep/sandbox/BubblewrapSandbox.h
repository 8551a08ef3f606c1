/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "pkgsweep/sandbox/Sandbox.h"

namespace facebook { namespace pkgsweep {

/**
 * Isolates the runtime with bubblewrap (--bwrap): the configuration's
 * `rootfs` becomes a read-only /, mounts are bound at their targets, and
 * the job runs in a new user namespace as `uid`:`gid` with `home` as its
 * working directory.  With CPUs assigned, the launcher itself is started
 * under --taskset, so that the pinning is inherited by the whole tree.
 */
class BubblewrapSandbox : public Sandbox {
public:
  SandboxCommand prepare(
    const Configuration& config,
    const SandboxRequest& request
  ) const override;

  std::string visiblePath(const Mount& m) const override {
    return m.target;
  }

  std::string name() const override { return "bwrap"; }
};

}}  // namespace facebook::pkgsweep
