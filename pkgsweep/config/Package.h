/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/dynamic.h>
#include <folly/Optional.h>
#include <string>
#include <vector>

namespace facebook { namespace pkgsweep {

/**
 * A package to evaluate.  Only the name is required; a version, a source
 * URL or a revision pin it to specific sources.
 */
struct Package {
  Package() {}
  explicit Package(std::string n) : name(std::move(n)) {}
  // Otherwise ambiguous between the string and the dynamic constructors.
  explicit Package(const char* n) : name(n) {}
  // Either "Name" or {"name": "Name", "version": "1.2.3", ...}
  explicit Package(const folly::dynamic& d);

  // Passed to the job script, which knows how to install it.
  folly::dynamic toDynamic() const;

  bool isPinned() const {
    return version.has_value() || url.has_value() || rev.has_value();
  }

  bool operator==(const Package& o) const {
    return name == o.name && version == o.version && url == o.url &&
      rev == o.rev;
  }

  std::string name;
  folly::Optional<std::string> version;
  folly::Optional<std::string> url;
  folly::Optional<std::string> rev;
};

// Reads a JSON array of packages.
std::vector<Package> loadPackages(const std::string& filename);

}}  // namespace facebook::pkgsweep
