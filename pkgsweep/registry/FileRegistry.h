/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/dynamic.h>
#include <folly/Synchronized.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "pkgsweep/registry/Registry.h"

namespace facebook { namespace pkgsweep {

/**
 * One parsed registry index file:
 *
 *   {"packages": {
 *     "Example": {"versions": {
 *       "0.5.3": {"tree_hash": "46e44e86...", "slug": "Bj8Gx",
 *                 "runtimes": ["1.9", "1.10"]}
 *     }}
 *   }}
 *
 * "slug" and "runtimes" are optional.  A version without "runtimes" is
 * compatible with every runtime; otherwise one of them must equal the
 * configuration's runtime version, or be a prefix of it ending at a dot
 * ("1.10" covers "1.10.2").
 */
class RegistryIndex {
public:
  struct Version {
    std::string version;
    Sha1 treeHash;
    std::string slug;
    std::vector<std::string> runtimes;

    bool supportsRuntime(const std::string& runtime_version) const;
  };

  explicit RegistryIndex(const folly::dynamic& d);

  // Newest first.
  const std::map<std::string, std::vector<Version>>& packages() const {
    return packages_;
  }

private:
  std::map<std::string, std::vector<Version>> packages_;
};

// Numeric where both parts are numbers, so "1.10.0" > "1.9.2".
bool versionLess(const std::string& a, const std::string& b);

/**
 * Serves each configuration from the index file named by its `registry`
 * field, or from `default_index` if that is empty.  Indexes are loaded
 * once, on first use.
 */
class FileRegistry : public Registry {
public:
  explicit FileRegistry(std::string default_index);

  std::vector<Package> compatiblePackages(
    const Configuration& config
  ) const override;

  folly::Optional<Sha1> lookupSlug(
    const Configuration& config,
    folly::StringPiece package,
    folly::StringPiece slug
  ) const override;

private:
  std::shared_ptr<const RegistryIndex> index(
    const Configuration& config
  ) const;

  const std::string defaultIndex_;
  mutable folly::Synchronized<
    std::map<std::string, std::shared_ptr<const RegistryIndex>>
  > indexes_;
};

}}  // namespace facebook::pkgsweep
