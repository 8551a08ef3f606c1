/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <vector>

#include "pkgsweep/processes/ProcessSupervisor.h"
#include "pkgsweep/runners/JobRunner.h"

namespace facebook { namespace pkgsweep {

class ArtifactStore;
class CacheManager;
class Registry;
class ScriptProvider;

/**
 * Evaluates a package by running the test script in the sandbox, in a
 * fresh working directory under `work_root`:
 *
 *   <workdir>/output  side channel & trace, at $PKGSWEEP_OUTPUT (rw)
 *   <workdir>/depot   private package depot, at $PKGSWEEP_DEPOT (rw)
 *   <workdir>/home    the sandbox's working directory
 *
 * With the shared cache, the job also sees the package, artifact and
 * compiled caches at $PKGSWEEP_SHARED_{PACKAGES,ARTIFACTS,COMPILED}, all
 * read-only, and is expected to put whatever it adds into its depot.
 * Afterwards, the depot's packages/, artifacts/ and compiled/ are
 * verified, and what survives is merged back into the shared caches.
 *
 * After a crash under the tracer, the pack-trace script compresses the
 * recording, which is uploaded to `artifacts` (if any), and the result is
 * appended to the log.
 *
 * Compiled configurations first build a runtime image with the compile
 * script, under a separate identity, then test using that image.
 *
 * `cache`, `registry` and `artifacts` may be null, in which case jobs
 * never use the shared caches and traces are not uploaded.
 */
class JobEvaluator : public JobRunner {
public:
  JobEvaluator(
    const ProcessSupervisor* supervisor,
    const ScriptProvider* scripts,
    CacheManager* cache,
    const Registry* registry,
    const ArtifactStore* artifacts,
    boost::filesystem::path work_root
  );

  void checkConfiguration(const Configuration& config) const override;

  Outcome evaluate(
    const Configuration& config,
    const Package& package,
    bool use_shared_cache
  ) const override;

private:
  Outcome evaluateTest(
    Configuration config,
    const Package& package,
    bool use_shared_cache,
    const std::vector<Mount>& extra_mounts
  ) const;

  Outcome evaluateCompiled(
    const Configuration& config,
    const Package& package,
    bool use_shared_cache
  ) const;

  // Runs the pack-trace script, and uploads the trace.  Returns the log.
  std::string packTrace(
    const Configuration& config,
    const Package& package,
    ScriptRequest request,
    const boost::filesystem::path& output_dir
  ) const;

  // Verifies the depot's caches, then merges them into the shared ones.
  void mergeCaches(
    const Configuration& config,
    const boost::filesystem::path& depot_dir
  ) const;

  const ProcessSupervisor* supervisor_;
  const ScriptProvider* scripts_;
  CacheManager* cache_;
  const Registry* registry_;
  const ArtifactStore* artifacts_;
  const boost::filesystem::path workRoot_;
};

}}  // namespace facebook::pkgsweep
