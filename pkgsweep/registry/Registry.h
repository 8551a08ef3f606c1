/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/Optional.h>
#include <folly/Range.h>
#include <vector>

#include "pkgsweep/cache/TreeHash.h"
#include "pkgsweep/config/Package.h"

namespace facebook { namespace pkgsweep {

class Configuration;

/**
 * The package catalog.  Implementations must be safe to query from
 * several threads at once, since jobs verify their package caches
 * concurrently.
 */
class Registry {
public:
  virtual ~Registry() {}

  /**
   * Every package that can be installed on `config`, each pinned to its
   * newest compatible version.  Sorted by name.
   */
  virtual std::vector<Package> compatiblePackages(
    const Configuration& config
  ) const = 0;

  /**
   * The tree hash of the sources that `package` unpacks to under slug
   * directory `slug`, or none if the registry knows no such version.
   */
  virtual folly::Optional<Sha1> lookupSlug(
    const Configuration& config,
    folly::StringPiece package,
    folly::StringPiece slug
  ) const = 0;
};

}}  // namespace facebook::pkgsweep
