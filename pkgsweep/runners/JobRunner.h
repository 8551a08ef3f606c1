/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "pkgsweep/statuses/Outcome.h"

namespace facebook { namespace pkgsweep {

class Configuration;
struct Package;

/**
 * Performs one attempt of one job: evaluates `package` under `config`,
 * and returns the classified outcome.
 *
 * The scheduler calls evaluate() concurrently from its worker threads, so
 * implementations must be thread-safe.  The configuration arrives fully
 * resolved: CPUs are pinned, and its tracing mode is either disabled or
 * enabled.  A package's own failures are outcomes, never exceptions.  An
 * exception means that the evaluation itself is broken, and stops the
 * whole run.
 *
 * With `use_shared_cache` false, the job must not see the caches shared
 * with other jobs, which lets a retry rule out cache corruption.
 */
class JobRunner {
public:
  virtual ~JobRunner() {}

  // Throws if this runner cannot evaluate `config` at all.  Called once
  // per configuration, before any job starts.
  virtual void checkConfiguration(const Configuration& /*config*/) const {}

  virtual Outcome evaluate(
    const Configuration& config,
    const Package& package,
    bool use_shared_cache
  ) const = 0;
};

}}  // namespace facebook::pkgsweep
