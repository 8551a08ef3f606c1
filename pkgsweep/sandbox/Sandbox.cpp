/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/sandbox/Sandbox.h"

#include <cstdlib>
#include <folly/Conv.h>
#include <folly/String.h>
#include <gflags/gflags.h>

#include "pkgsweep/config/Configuration.h"
#include "pkgsweep/sandbox/BubblewrapSandbox.h"
#include "pkgsweep/sandbox/LocalSandbox.h"
#include "pkgsweep/utils/Exception.h"

DEFINE_string(
  passthrough_env, "PKGSWEEP_PKG_SERVER",
  "Comma-separated names of environment variables that are passed from "
  "pkgsweep to every job, e.g. the address of a package server."
);

namespace facebook { namespace pkgsweep {

std::vector<std::string> Sandbox::makeEnvironment(
    const Configuration& config,
    const SandboxRequest& request,
    const std::string& home) {
  std::map<std::string, std::string> env{
    {"PATH", "/usr/local/bin:/usr/bin:/bin"},
    {"HOME", home},
    {"USER", config.user},
    {"LANG", "C.UTF-8"},
  };
  std::vector<folly::StringPiece> names;
  folly::split(',', FLAGS_passthrough_env, names, /*ignoreEmpty=*/ true);
  for (auto name : names) {
    auto key = name.str();
    if (const char* value = ::getenv(key.c_str())) {
      env[key] = value;
    }
  }
  for (const auto& kv : config.env) {
    env[kv.first] = kv.second;
  }
  for (const auto& kv : request.env) {
    env[kv.first] = kv.second;
  }
  std::vector<std::string> out;
  for (const auto& kv : env) {
    out.emplace_back(folly::to<std::string>(kv.first, '=', kv.second));
  }
  return out;
}

std::unique_ptr<Sandbox> makeSandbox(const std::string& type) {
  if (type == "local") {
    return std::make_unique<LocalSandbox>();
  } else if (type == "bwrap") {
    return std::make_unique<BubblewrapSandbox>();
  }
  throw PkgSweepException("Unknown sandbox type: ", type);
}

}}  // namespace facebook::pkgsweep
