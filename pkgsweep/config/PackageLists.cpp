/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/config/PackageLists.h"

#include <folly/String.h>
#include <gflags/gflags.h>
#include <vector>

DEFINE_string(
  skip_packages, "",
  "Comma-separated packages that are never evaluated, in addition to the "
  "built-in list.  Ignored when an explicit package list is given."
);
DEFINE_string(
  untraced_packages, "",
  "Comma-separated packages that always run without the record-replay "
  "tracer, in addition to the built-in list."
);
DEFINE_string(
  slow_packages, "",
  "Comma-separated packages that get twice the time limit, in addition to "
  "the built-in list."
);

namespace facebook { namespace pkgsweep {

namespace {

std::set<std::string> withFlag(
    std::set<std::string> names,
    const std::string& flag) {
  auto extra = parsePackageNames(flag);
  names.insert(extra.begin(), extra.end());
  return names;
}

}  // anonymous namespace

std::set<std::string> parsePackageNames(folly::StringPiece s) {
  std::vector<folly::StringPiece> pieces;
  folly::split(',', s, pieces, /*ignoreEmpty=*/ true);
  std::set<std::string> names;
  for (auto p : pieces) {
    auto name = folly::trimWhitespace(p);
    if (!name.empty()) {
      names.insert(name.str());
    }
  }
  return names;
}

// Flags are parsed by the time these are first called, so it is fine to
// cache the result.

const std::set<std::string>& skippedPackages() {
  // Commercial solvers, which cannot be installed without a license.
  static const std::set<std::string> names = withFlag(
    {"CPLEX", "Gurobi", "KNITRO", "MosekTools", "Xpress"},
    FLAGS_skip_packages
  );
  return names;
}

const std::set<std::string>& untracedPackages() {
  // GPU drivers and JIT debuggers, which the tracer cannot record.
  static const std::set<std::string> names = withFlag(
    {"AMDGPU", "CUDA", "Metal", "oneAPI"},
    FLAGS_untraced_packages
  );
  return names;
}

const std::set<std::string>& slowPackages() {
  static const std::set<std::string> names = withFlag(
    {"DifferentialEquations", "Oscar", "Trixi"},
    FLAGS_slow_packages
  );
  return names;
}

}}  // namespace facebook::pkgsweep
