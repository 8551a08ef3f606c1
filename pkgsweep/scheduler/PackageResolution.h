/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <vector>

#include "pkgsweep/config/Package.h"
#include "pkgsweep/scheduler/ResultTable.h"

namespace facebook { namespace pkgsweep {

class Configuration;
class Registry;

struct ResolvedPackages {
  std::vector<Package> packages;
  // skip/uninstallable rows for requested packages that no configuration
  // can install, one per configuration.
  std::vector<ResultRow> skips;
  // The caller named the packages, which bypasses the blacklist.
  bool explicitList{false};
};

/**
 * Decides what to evaluate, so that every configuration tests the same
 * thing.  The compatible set is the intersection over configurations of
 * the registry's compatible packages (each registry is asked once).
 *
 *  - No requested packages: the compatible set.
 *  - Otherwise, each requested package that is pinned is kept as-is, an
 *    unpinned one gets the version from the compatible set, and one that
 *    is not in the set becomes skip rows.
 */
ResolvedPackages resolvePackages(
  const Registry& registry,
  const std::vector<Configuration>& configs,
  const std::vector<Package>& requested
);

}}  // namespace facebook::pkgsweep
