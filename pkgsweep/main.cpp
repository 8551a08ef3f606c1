/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <boost/filesystem.hpp>
#include <folly/init/Init.h>
#include <gflags/gflags.h>
#include <glog/logging.h>
#include <memory>
#include <unistd.h>

#include "pkgsweep/cache/CacheManager.h"
#include "pkgsweep/config/Configuration.h"
#include "pkgsweep/config/Package.h"
#include "pkgsweep/config/PackageLists.h"
#include "pkgsweep/processes/ProcessSupervisor.h"
#include "pkgsweep/registry/FileRegistry.h"
#include "pkgsweep/runners/ArtifactStore.h"
#include "pkgsweep/runners/JobEvaluator.h"
#include "pkgsweep/runners/ScriptProvider.h"
#include "pkgsweep/sandbox/Sandbox.h"
#include "pkgsweep/scheduler/Evaluation.h"
#include "pkgsweep/utils/CancellationToken.h"

DEFINE_string(
  configs, "",
  "JSON file of the form {\"configurations\": [...]}, see Configuration.h."
);
DEFINE_string(
  packages, "",
  "JSON array of packages to evaluate, as names or objects with a pinned "
  "version, url or rev.  If empty, every package that all configurations "
  "can install is evaluated, except for blacklisted ones."
);
DEFINE_string(
  registry, "",
  "Registry index for configurations that do not name their own."
);
DEFINE_string(
  scripts_dir, "",
  "Directory with the job scripts: `test`, and optionally `compile` and "
  "`pack_trace`."
);
DEFINE_string(
  storage_dir, "",
  "Where the caches shared between jobs live.  If empty, every job starts "
  "from scratch."
);
DEFINE_string(
  work_dir, "",
  "Where jobs get their private directories.  Defaults to the system "
  "temporary directory."
);
DEFINE_string(sandbox, "local", "How to isolate jobs: local or bwrap.");
DEFINE_int32(ninstances, 1, "How many jobs to run at once.");
DEFINE_bool(
  retry, true,
  "Re-run crashes under the tracer, and failures without the shared caches."
);
DEFINE_bool(validate, false, "Verify the shared caches before starting.");
DEFINE_string(
  blacklist, "",
  "Comma-separated packages to skip, unless --packages names them."
);
DEFINE_bool(
  progress, true,
  "Report progress: a bar on a terminal, periodic log lines otherwise."
);
DEFINE_string(
  output_file, "",
  "Where to write the results as JSON.  Standard output if empty."
);

static const bool configs_validator = gflags::RegisterFlagValidator(
    &FLAGS_configs,
    [](const char* /*flagname*/, const std::string& value) {
      return !value.empty();
    });

static const bool scripts_dir_validator = gflags::RegisterFlagValidator(
    &FLAGS_scripts_dir,
    [](const char* /*flagname*/, const std::string& value) {
      return !value.empty();
    });

static const bool ninstances_validator = gflags::RegisterFlagValidator(
    &FLAGS_ninstances,
    [](const char* /*flagname*/, int32_t value) {
      return value > 0;
    });

using namespace facebook::pkgsweep;
namespace fs = boost::filesystem;

namespace {

int run() {
  auto configs = loadConfigurations(FLAGS_configs);
  std::vector<Package> packages;
  if (!FLAGS_packages.empty()) {
    packages = loadPackages(FLAGS_packages);
  }

  CancellationToken token;
  auto sandbox = makeSandbox(FLAGS_sandbox);
  ProcessSupervisor supervisor(sandbox.get(), &token);
  FileScriptProvider scripts(FLAGS_scripts_dir);
  FileRegistry registry(FLAGS_registry);
  std::unique_ptr<CacheManager> cache;
  if (!FLAGS_storage_dir.empty()) {
    cache = std::make_unique<CacheManager>(FLAGS_storage_dir);
  }
  auto artifacts = makeArtifactStoreFromFlags();
  fs::path work_root = FLAGS_work_dir.empty()
    ? fs::temp_directory_path() : fs::path(FLAGS_work_dir);
  JobEvaluator evaluator(
    &supervisor,
    &scripts,
    cache.get(),
    &registry,
    artifacts.get(),
    work_root
  );

  EvaluationOptions options;
  options.ninstances = FLAGS_ninstances;
  options.retry = FLAGS_retry;
  options.validate = FLAGS_validate;
  options.blacklist = parsePackageNames(FLAGS_blacklist);
  options.progress = FLAGS_progress;

  Evaluation evaluation(&evaluator, &registry, cache.get(), &token, options);
  auto results = evaluation.run(configs, packages);
  if (FLAGS_output_file.empty()) {
    writeResults(results, STDOUT_FILENO);
  } else {
    writeResults(results, FLAGS_output_file);
  }
  LOG(INFO) << "Recorded " << results.size() << " results: "
    << results.count(Status::Ok) << " ok, "
    << results.count(Status::Fail) << " failed, "
    << results.count(Status::Crash) << " crashed, "
    << results.count(Status::Kill) << " killed, "
    << results.count(Status::Skip) << " skipped";
  return token.isCancelled() ? 1 : 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
  FLAGS_logtostderr = 1;
  folly::init(&argc, &argv);
  try {
    return run();
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Evaluation failed: " << ex.what();
    return 2;
  }
}
