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
 * Runs the runtime directly as the current user, in the job's working
 * directory.  Nothing is isolated: mounts are not performed but instead
 * are visible at their host paths, `rootfs` and the identity fields are
 * ignored, and read-only mounts are writable.  Meant for tests and for
 * trusted packages.
 */
class LocalSandbox : public Sandbox {
public:
  SandboxCommand prepare(
    const Configuration& config,
    const SandboxRequest& request
  ) const override;

  std::string visiblePath(const Mount& m) const override {
    return m.hostPath;
  }

  std::string name() const override { return "local"; }
};

}}  // namespace facebook::pkgsweep
