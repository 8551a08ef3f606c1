/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <chrono>
#include <folly/dynamic.h>
#include <folly/Optional.h>
#include <map>
#include <string>
#include <sys/types.h>
#include <vector>

namespace facebook { namespace pkgsweep {

/**
 * Whether a job runs under a record-replay tracer, whose trace is packed
 * up as a debug artifact when the job crashes.
 */
enum class TracingMode {
  Disabled,
  Enabled,
  // The first attempt runs untraced; a crash is re-run with tracing.
  EnabledOnRetry,
};

folly::StringPiece tracingModeName(TracingMode m);
TracingMode parseTracingMode(folly::StringPiece s);  // Throws if unknown

/**
 * One evaluation environment.  Configurations are values: they are never
 * modified once parsed, and derived environments (a doubled time limit for
 * a slow package, tracing forced on for a retry, a pinned CPU) are made
 * with with().
 *
 * Parsed from JSON such as:
 *
 *   {"name": "stable", "runtime": ["/usr/bin/env", "julia", "-"],
 *    "time_limit_sec": 2700, "tracing": "enabled_on_retry"}
 *
 * All keys but "name" are optional.
 */
class Configuration {
public:
  struct Overrides {
    folly::Optional<std::vector<std::string>> runtimeFlags;
    folly::Optional<std::string> rootfs;
    folly::Optional<uid_t> uid;
    folly::Optional<gid_t> gid;
    folly::Optional<std::string> user;
    folly::Optional<std::string> group;
    folly::Optional<std::string> home;
    folly::Optional<TracingMode> tracing;
    folly::Optional<std::chrono::milliseconds> timeLimit;
    folly::Optional<bool> compiled;
    folly::Optional<std::vector<int>> cpus;
  };

  explicit Configuration(const folly::dynamic& d);

  Configuration with(const Overrides& o) const;

  folly::dynamic toDynamic() const;

  // Twice timeLimit when tracing, which slows execution down a lot.
  std::chrono::milliseconds effectiveTimeLimit() const;

  // The fields that determine whether two configurations can share a
  // compiled-code cache.
  std::string compiledCacheKey() const;

  std::string name;
  // Interpreter that reads the job script from its standard input.
  std::vector<std::string> runtime{"/bin/sh", "-s", "--"};
  std::string runtimeVersion;
  std::vector<std::string> runtimeFlags;
  std::vector<std::string> buildFlags;
  std::string rootfs;
  uid_t uid{1000};
  gid_t gid{1000};
  std::string user{"pkgsweep"};
  std::string group{"pkgsweep"};
  std::string home{"/home/pkgsweep"};
  TracingMode tracing{TracingMode::Disabled};
  std::chrono::milliseconds timeLimit{std::chrono::seconds(45 * 60)};
  std::chrono::milliseconds compileTimeLimit{std::chrono::seconds(30 * 60)};
  uint64_t logLimitBytes{1 << 20};
  bool compiled{false};
  bool precompile{true};
  std::vector<int> cpus;
  // Registry index listing the packages this runtime can install.
  std::string registry;
  std::map<std::string, std::string> env;
};

// Throws unless the names are unique and every log limit is positive.
void checkConfigurations(const std::vector<Configuration>& configs);

// Reads {"configurations": [...]} from a JSON file, and checks the result.
std::vector<Configuration> loadConfigurations(const std::string& filename);

}}  // namespace facebook::pkgsweep
