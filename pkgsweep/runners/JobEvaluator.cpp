/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/runners/JobEvaluator.h"

#include <boost/filesystem/operations.hpp>
#include <boost/regex.hpp>
#include <chrono>
#include <folly/Conv.h>
#include <folly/json.h>
#include <gflags/gflags.h>
#include <glog/logging.h>

#include "pkgsweep/cache/CacheManager.h"
#include "pkgsweep/cache/CacheVerifier.h"
#include "pkgsweep/config/Configuration.h"
#include "pkgsweep/config/Package.h"
#include "pkgsweep/config/PackageLists.h"
#include "pkgsweep/registry/Registry.h"
#include "pkgsweep/runners/ArtifactStore.h"
#include "pkgsweep/runners/ScriptProvider.h"
#include "pkgsweep/runners/SideChannel.h"
#include "pkgsweep/statuses/OutcomeClassifier.h"
#include "pkgsweep/utils/Exception.h"
#include "pkgsweep/utils/TemporaryDir.h"

DEFINE_string(
  image_flag, "--sysimage",
  "Runtime flag that makes the tests of a compiled configuration use the "
  "image built by the compile script."
);

namespace facebook { namespace pkgsweep {

namespace fs = boost::filesystem;

namespace {

using Clock = std::chrono::steady_clock;

// The identity that images are compiled under, so that an image which
// hard-codes paths of its build environment fails its tests.
constexpr uid_t kCompileUid = 2000;
constexpr gid_t kCompileGid = 2000;

const std::string kSeparator = std::string(80, '#') + "\n";

// Keep build scripts from picking up a Python or R of the runtime image.
void addPackageHacks(std::map<std::string, std::string>* env) {
  (*env)["PYTHON"] = "";
  (*env)["R_HOME"] = "*";
}

void addMount(
    const Sandbox& sandbox,
    ScriptRequest* request,
    const fs::path& host_path,
    std::string target,
    bool writable,
    const std::string& env_var) {
  Mount m{host_path.native(), std::move(target), writable};
  request->env[env_var] = sandbox.visiblePath(m);
  request->mounts.emplace_back(std::move(m));
}

bool isDirectory(const fs::path& p) {
  boost::system::error_code ec;
  return fs::is_directory(fs::symlink_status(p, ec));
}

// The first argument of every script.
std::string packageArgument(const Package& package) {
  folly::json::serialization_opts opts;
  opts.sort_keys = true;
  return folly::json::serialize(package.toDynamic(), opts);
}

int64_t unixTime() {
  return std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()
  ).count();
}

}  // anonymous namespace

JobEvaluator::JobEvaluator(
    const ProcessSupervisor* supervisor,
    const ScriptProvider* scripts,
    CacheManager* cache,
    const Registry* registry,
    const ArtifactStore* artifacts,
    fs::path work_root)
  : supervisor_(supervisor),
    scripts_(scripts),
    cache_(cache),
    registry_(registry),
    artifacts_(artifacts),
    workRoot_(std::move(work_root)) {
  CHECK(supervisor_);
  CHECK(scripts_);
  fs::create_directories(workRoot_);
}

void JobEvaluator::checkConfiguration(const Configuration& config) const {
  if (config.compiled && scripts_->compileScript().empty()) {
    throw PkgSweepException(
      "Configuration '", config.name, "' is compiled, but there is no "
      "compile script"
    );
  }
  if (config.tracing != TracingMode::Disabled &&
      scripts_->packTraceScript().empty()) {
    LOG(WARNING) << "Configuration '" << config.name << "' is traced, but "
      << "there is no script to pack up the traces";
  }
}

Outcome JobEvaluator::evaluate(
    const Configuration& config,
    const Package& package,
    bool use_shared_cache) const {
  CHECK(config.tracing != TracingMode::EnabledOnRetry)
    << "Tracing of " << config.name << " must be resolved before evaluation";
  bool use_cache = use_shared_cache && cache_ && registry_;
  LOG(INFO) << "Evaluating " << package.name << " on " << config.name
    << (use_cache ? "" : " without the shared caches");
  auto outcome = config.compiled
    ? evaluateCompiled(config, package, use_cache)
    : evaluateTest(config, package, use_cache, {});
  LOG(INFO) << "Evaluated " << package.name << " on " << config.name << ": "
    << statusName(outcome.status)
    << (outcome.reason ? "/" : "")
    << (outcome.reason ? reasonName(*outcome.reason) : folly::StringPiece());
  return outcome;
}

Outcome JobEvaluator::evaluateTest(
    Configuration config,
    const Package& package,
    bool use_cache,
    const std::vector<Mount>& extra_mounts) const {
  if (slowPackages().count(package.name)) {
    Configuration::Overrides o;
    o.timeLimit = 2 * config.timeLimit;
    config = config.with(o);
  }

  TemporaryDir workdir(
    workRoot_, sanitizeFileName(package.name + "-" + config.name)
  );
  auto output_dir = workdir.getPath() / "output";
  auto depot_dir = workdir.getPath() / "depot";
  auto home_dir = workdir.getPath() / "home";
  for (const auto& dir : {output_dir, depot_dir, home_dir}) {
    fs::create_directories(dir);
  }

  const auto& sandbox = supervisor_->sandbox();
  ScriptRequest request;
  request.script = scripts_->testScript();
  request.args = {packageArgument(package)};
  request.workDir = home_dir.native();
  request.mounts = extra_mounts;
  addMount(sandbox, &request, output_dir, "/output", true, "PKGSWEEP_OUTPUT");
  addMount(sandbox, &request, depot_dir, "/depot", true, "PKGSWEEP_DEPOT");
  if (use_cache) {
    addMount(
      sandbox, &request, cache_->packagesDir(), "/shared/packages", false,
      "PKGSWEEP_SHARED_PACKAGES"
    );
    addMount(
      sandbox, &request, cache_->artifactsDir(), "/shared/artifacts", false,
      "PKGSWEEP_SHARED_ARTIFACTS"
    );
    addMount(
      sandbox, &request, cache_->compiledDir(config), "/shared/compiled",
      false, "PKGSWEEP_SHARED_COMPILED"
    );
  }
  request.env["PKGSWEEP_TRACING"] =
    config.tracing == TracingMode::Enabled ? "true" : "false";
  request.env["PKGSWEEP_PRECOMPILE"] = config.precompile ? "true" : "false";
  addPackageHacks(&request.env);

  auto start = Clock::now();
  auto result = supervisor_->runScript(config, request);
  double elapsed_sec =
    std::chrono::duration<double>(Clock::now() - start).count();

  Outcome outcome;
  outcome.log = std::move(result.log);
  outcome.log += '\n';

  auto side_channel = readSideChannel(output_dir, package.name, config.name);
  outcome.version = side_channel.version;
  outcome.duration = side_channel.duration;

  ClassifierInput input;
  input.packageName = package.name;
  input.status = result.status;
  input.reason = result.reason;
  input.installed = side_channel.installed;
  auto c = classifyOutcome(input, outcome.log);
  outcome.status = c.status;
  outcome.reason = c.reason;
  outcome.log += outcomeTrailer(c.status, c.reason, elapsed_sec);

  // Packing is expensive, so only crashes get a trace.
  if (config.tracing == TracingMode::Enabled && c.status == Status::Crash) {
    outcome.log += packTrace(config, package, request, output_dir);
  }

  if (use_cache) {
    mergeCaches(config, depot_dir);
  }
  return outcome;
}

std::string JobEvaluator::packTrace(
    const Configuration& config,
    const Package& package,
    ScriptRequest request,
    const fs::path& output_dir) const {
  if (scripts_->packTraceScript().empty()) {
    return "Testing produced an rr trace, but there is no script to pack it.\n";
  }
  Configuration::Overrides o;
  o.timeLimit = 2 * config.timeLimit;
  request.script = scripts_->packTraceScript();
  auto log = supervisor_->runScript(config.with(o), request).log;
  if (!log.empty() && log.back() != '\n') {
    log += '\n';
  }

  auto trace = output_dir / (package.name + ".tar.zst");
  boost::system::error_code ec;
  if (!artifacts_) {
    log += "Testing produced an rr trace, but pkgsweep was not configured "
      "to upload rr traces.\n";
  } else if (!fs::is_regular_file(trace, ec)) {
    log += "Testing did not produce an rr trace.\n";
  } else {
    auto name = folly::to<std::string>(package.name, '-', unixTime(), ".tar.zst");
    try {
      log += folly::to<std::string>(
        "Uploaded rr trace to ", artifacts_->upload(trace, name), "\n"
      );
    } catch (const std::exception& ex) {
      LOG(ERROR) << "Failed to upload the trace of " << package.name << " on "
        << config.name << ": " << ex.what();
      log += folly::to<std::string>("Failed to upload rr trace: ", ex.what(), "\n");
    }
  }

  // The tracer reports these spuriously for files changed outside of the
  // recording.
  static const boost::regex kSpuriousErrors(
    R"(\[ERROR [^\n]* Metadata of [^\n]* changed: [^\n]*\n)"
  );
  return boost::regex_replace(log, kSpuriousErrors, "");
}

void JobEvaluator::mergeCaches(
    const Configuration& config,
    const fs::path& depot_dir) const {
  auto packages = depot_dir / "packages";
  auto artifacts = depot_dir / "artifacts";
  auto compiled = depot_dir / "compiled";
  if (isDirectory(packages)) {
    removeUncacheablePackages(*registry_, config, packages);
    cache_->copyBack(packages, cache_->packagesDir());
  }
  if (isDirectory(artifacts)) {
    verifyArtifacts(artifacts);
    cache_->copyBack(artifacts, cache_->artifactsDir());
  }
  if (isDirectory(compiled)) {
    verifyCompileCache(compiled);
    cache_->copyBack(compiled, cache_->compiledDir(config));
  }
}

Outcome JobEvaluator::evaluateCompiled(
    const Configuration& config,
    const Package& package,
    bool use_cache) const {
  auto prefix = sanitizeFileName(package.name + "-" + config.name);
  TemporaryDir image_dir(workRoot_, prefix + "-image");
  TemporaryDir compile_dir(workRoot_, prefix + "-compile");
  Mount image_mount{image_dir.getPath().native(), "/image", true};
  auto image_path = supervisor_->sandbox().visiblePath(image_mount) + "/image.so";

  Configuration::Overrides o;
  o.timeLimit = config.compileTimeLimit;
  o.tracing = TracingMode::Disabled;  // Only record the tests
  o.compiled = false;
  o.uid = kCompileUid;
  o.gid = kCompileGid;
  o.user = "user";
  o.group = "group";
  o.home = "/home/user";

  ScriptRequest request;
  request.script = scripts_->compileScript();
  request.args = {packageArgument(package), image_path};
  request.mounts = {image_mount};
  request.workDir = compile_dir.getPath().native();
  addPackageHacks(&request.env);
  auto result = supervisor_->runScript(config.with(o), request);

  auto c = classifyCompilation(result.status, result.reason);
  auto compile_log = std::move(result.log);
  compile_log += '\n';
  compile_log += compilationTrailer(c.status, c.reason);
  if (c.status != Status::Ok) {
    Outcome outcome;
    outcome.status = c.status;
    outcome.reason = c.reason;
    outcome.log = std::move(compile_log);
    return outcome;
  }

  Configuration::Overrides t;
  t.compiled = false;
  t.runtimeFlags = config.runtimeFlags;
  t.runtimeFlags->push_back(FLAGS_image_flag);
  t.runtimeFlags->push_back(image_path);
  image_mount.writable = false;
  auto outcome = evaluateTest(config.with(t), package, use_cache, {image_mount});
  outcome.log = folly::to<std::string>(
    compile_log, "\n\n", kSeparator, kSeparator, "\n\n", outcome.log
  );
  return outcome;
}

}}  // namespace facebook::pkgsweep
