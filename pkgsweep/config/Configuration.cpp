/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/config/Configuration.h"

#include <folly/Conv.h>
#include <folly/experimental/DynamicParser.h>
#include <folly/FileUtil.h>
#include <folly/json.h>
#include <folly/String.h>
#include <unordered_set>

#include "pkgsweep/config/parsing_common.h"
#include "pkgsweep/utils/Exception.h"

namespace facebook { namespace pkgsweep {

namespace {

constexpr folly::StringPiece kName = "name";
constexpr folly::StringPiece kRuntime = "runtime";
constexpr folly::StringPiece kRuntimeVersion = "runtime_version";
constexpr folly::StringPiece kRuntimeFlags = "runtime_flags";
constexpr folly::StringPiece kBuildFlags = "build_flags";
constexpr folly::StringPiece kRootfs = "rootfs";
constexpr folly::StringPiece kUid = "uid";
constexpr folly::StringPiece kGid = "gid";
constexpr folly::StringPiece kUser = "user";
constexpr folly::StringPiece kGroup = "group";
constexpr folly::StringPiece kHome = "home";
constexpr folly::StringPiece kTracing = "tracing";
constexpr folly::StringPiece kTimeLimitSec = "time_limit_sec";
constexpr folly::StringPiece kCompileTimeLimitSec = "compile_time_limit_sec";
constexpr folly::StringPiece kLogLimitBytes = "log_limit_bytes";
constexpr folly::StringPiece kCompiled = "compiled";
constexpr folly::StringPiece kPrecompile = "precompile";
constexpr folly::StringPiece kCpus = "cpus";
constexpr folly::StringPiece kRegistry = "registry";
constexpr folly::StringPiece kEnv = "env";
constexpr folly::StringPiece kConfigurations = "configurations";

}  // anonymous namespace

folly::StringPiece tracingModeName(TracingMode m) {
  switch (m) {
    case TracingMode::Disabled:
      return "disabled";
    case TracingMode::Enabled:
      return "enabled";
    case TracingMode::EnabledOnRetry:
      return "enabled_on_retry";
  }
  throw PkgSweepException("Bad tracing mode ", static_cast<int>(m));
}

TracingMode parseTracingMode(folly::StringPiece s) {
  for (auto m : {TracingMode::Disabled, TracingMode::Enabled,
                 TracingMode::EnabledOnRetry}) {
    if (tracingModeName(m) == s) {
      return m;
    }
  }
  throw PkgSweepException("Unknown tracing mode: ", s);
}

Configuration::Configuration(const folly::dynamic& d) {
  folly::DynamicParser p(folly::DynamicParser::OnError::RECORD, &d);
  p.required(kName, [&](std::string&& s) {
    if (s.empty()) {
      throw std::runtime_error("Must be non-empty");
    }
    name = std::move(s);
  });
  p.optional(kRuntime, [&]() {
    runtime = parseStringList(&p);
    if (runtime.empty()) {
      throw std::runtime_error("Must name an executable");
    }
  });
  p.optional(kRuntimeVersion, [&](std::string&& s) {
    runtimeVersion = std::move(s);
  });
  p.optional(kRuntimeFlags, [&]() { runtimeFlags = parseStringList(&p); });
  p.optional(kBuildFlags, [&]() { buildFlags = parseStringList(&p); });
  p.optional(kRootfs, [&](std::string&& s) { rootfs = std::move(s); });
  p.optional(kUid, [&](int64_t n) { uid = folly::to<uid_t>(n); });
  p.optional(kGid, [&](int64_t n) { gid = folly::to<gid_t>(n); });
  p.optional(kUser, [&](std::string&& s) { user = std::move(s); });
  p.optional(kGroup, [&](std::string&& s) { group = std::move(s); });
  p.optional(kHome, [&](std::string&& s) { home = std::move(s); });
  p.optional(kTracing, [&](const std::string& s) {
    tracing = parseTracingMode(s);
  });
  p.optional(kTimeLimitSec, [&](const folly::dynamic& v) {
    timeLimit = parsePositiveSeconds(v);
  });
  p.optional(kCompileTimeLimitSec, [&](const folly::dynamic& v) {
    compileTimeLimit = parsePositiveSeconds(v);
  });
  p.optional(kLogLimitBytes, [&](int64_t n) {
    if (n <= 0) {
      throw std::runtime_error("Must be positive");
    }
    logLimitBytes = n;
  });
  p.optional(kCompiled, [&](bool b) { compiled = b; });
  p.optional(kPrecompile, [&](bool b) { precompile = b; });
  p.optional(kCpus, [&]() {
    p.arrayItems([&](int64_t n) { cpus.push_back(folly::to<int>(n)); });
  });
  p.optional(kRegistry, [&](std::string&& s) { registry = std::move(s); });
  p.optional(kEnv, [&]() {
    p.objectItems([&](const std::string& k, std::string&& v) {
      env[k] = std::move(v);
    });
  });

  auto errors = p.releaseErrors();
  if (!errors.empty()) {
    throw PkgSweepException(
      "Invalid configuration: ", folly::toPrettyJson(errors)
    );
  }
}

Configuration Configuration::with(const Overrides& o) const {
  Configuration c(*this);
  if (o.runtimeFlags) { c.runtimeFlags = *o.runtimeFlags; }
  if (o.rootfs) { c.rootfs = *o.rootfs; }
  if (o.uid) { c.uid = *o.uid; }
  if (o.gid) { c.gid = *o.gid; }
  if (o.user) { c.user = *o.user; }
  if (o.group) { c.group = *o.group; }
  if (o.home) { c.home = *o.home; }
  if (o.tracing) { c.tracing = *o.tracing; }
  if (o.timeLimit) { c.timeLimit = *o.timeLimit; }
  if (o.compiled) { c.compiled = *o.compiled; }
  if (o.cpus) { c.cpus = *o.cpus; }
  return c;
}

folly::dynamic Configuration::toDynamic() const {
  folly::dynamic d_env = folly::dynamic::object;
  for (const auto& kv : env) {
    d_env[kv.first] = kv.second;
  }
  return folly::dynamic::object
    (kName, name)
    (kRuntime, folly::dynamic(runtime.begin(), runtime.end()))
    (kRuntimeVersion, runtimeVersion)
    (kRuntimeFlags, folly::dynamic(runtimeFlags.begin(), runtimeFlags.end()))
    (kBuildFlags, folly::dynamic(buildFlags.begin(), buildFlags.end()))
    (kRootfs, rootfs)
    (kUid, uid)
    (kGid, gid)
    (kUser, user)
    (kGroup, group)
    (kHome, home)
    (kTracing, tracingModeName(tracing))
    (kTimeLimitSec, 0.001 * timeLimit.count())
    (kCompileTimeLimitSec, 0.001 * compileTimeLimit.count())
    (kLogLimitBytes, static_cast<int64_t>(logLimitBytes))
    (kCompiled, compiled)
    (kPrecompile, precompile)
    (kCpus, folly::dynamic(cpus.begin(), cpus.end()))
    (kRegistry, registry)
    (kEnv, std::move(d_env));
}

std::chrono::milliseconds Configuration::effectiveTimeLimit() const {
  return tracing == TracingMode::Enabled ? 2 * timeLimit : timeLimit;
}

std::string Configuration::compiledCacheKey() const {
  return folly::toJson(folly::dynamic::array(
    folly::dynamic(runtime.begin(), runtime.end()),
    runtimeVersion,
    folly::dynamic(buildFlags.begin(), buildFlags.end()),
    rootfs,
    uid,
    user,
    gid,
    group,
    home
  ));
}

void checkConfigurations(const std::vector<Configuration>& configs) {
  if (configs.empty()) {
    throw PkgSweepException("No configurations to evaluate");
  }
  std::unordered_set<std::string> names;
  for (const auto& config : configs) {
    if (!names.insert(config.name).second) {
      throw PkgSweepException(
        "Configuration names must be unique, got '", config.name, "' twice"
      );
    }
    if (config.logLimitBytes == 0) {
      throw PkgSweepException(
        "Configuration '", config.name, "' needs a positive log limit"
      );
    }
  }
}

std::vector<Configuration> loadConfigurations(const std::string& filename) {
  std::string contents;
  if (!folly::readFile(filename.c_str(), contents)) {
    throw PkgSweepException("Could not read ", filename, ": ", strError());
  }
  auto d = folly::parseJson(contents);
  std::vector<Configuration> configs;
  const auto* d_configs = d.get_ptr(kConfigurations);
  if (!d_configs || !d_configs->isArray()) {
    throw PkgSweepException(
      filename, " must contain a '", kConfigurations, "' array"
    );
  }
  for (const auto& d_config : *d_configs) {
    configs.emplace_back(d_config);
  }
  checkConfigurations(configs);
  return configs;
}

}}  // namespace facebook::pkgsweep
