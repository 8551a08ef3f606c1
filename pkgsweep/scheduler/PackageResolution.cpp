/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/scheduler/PackageResolution.h"

#include <algorithm>
#include <glog/logging.h>
#include <set>
#include <unordered_map>

#include "pkgsweep/config/Configuration.h"
#include "pkgsweep/registry/Registry.h"

namespace facebook { namespace pkgsweep {

namespace {

std::vector<Package> compatibleWithAll(
    const Registry& registry,
    const std::vector<Configuration>& configs) {
  std::vector<Package> compatible;
  std::set<std::string> seen_registries;
  bool first = true;
  for (const auto& config : configs) {
    if (!seen_registries.insert(config.registry).second) {
      continue;
    }
    auto packages = registry.compatiblePackages(config);
    if (first) {
      compatible = std::move(packages);
      first = false;
      continue;
    }
    compatible.erase(
      std::remove_if(
        compatible.begin(), compatible.end(),
        [&packages](const Package& p) {
          return std::find(packages.begin(), packages.end(), p)
            == packages.end();
        }
      ),
      compatible.end()
    );
  }
  return compatible;
}

}  // anonymous namespace

ResolvedPackages resolvePackages(
    const Registry& registry,
    const std::vector<Configuration>& configs,
    const std::vector<Package>& requested) {
  ResolvedPackages res;
  auto compatible = compatibleWithAll(registry, configs);
  if (requested.empty()) {
    res.packages = std::move(compatible);
    LOG(INFO) << res.packages.size() << " packages are compatible with every "
      << "configuration";
    return res;
  }

  res.explicitList = true;
  std::unordered_map<std::string, const Package*> by_name;
  for (const auto& p : compatible) {
    by_name.emplace(p.name, &p);
  }
  for (const auto& p : requested) {
    if (p.isPinned()) {
      res.packages.push_back(p);
      continue;
    }
    auto it = by_name.find(p.name);
    if (it != by_name.end()) {
      auto resolved = p;
      resolved.version = it->second->version;
      res.packages.emplace_back(std::move(resolved));
      continue;
    }
    LOG(WARNING) << "No version of " << p.name << " is compatible with every "
      << "configuration, skipping it";
    for (const auto& config : configs) {
      res.skips.emplace_back(
        ResultRow::skip(config.name, p.name, Reason::Uninstallable)
      );
    }
  }
  return res;
}

}}  // namespace facebook::pkgsweep
