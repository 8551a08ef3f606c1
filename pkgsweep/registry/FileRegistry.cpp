/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/registry/FileRegistry.h"

#include <algorithm>
#include <folly/Conv.h>
#include <folly/experimental/DynamicParser.h>
#include <folly/FileUtil.h>
#include <folly/json.h>
#include <folly/String.h>
#include <glog/logging.h>

#include "pkgsweep/config/Configuration.h"
#include "pkgsweep/config/parsing_common.h"
#include "pkgsweep/utils/Exception.h"

namespace facebook { namespace pkgsweep {

namespace {
constexpr folly::StringPiece kPackages = "packages";
constexpr folly::StringPiece kVersions = "versions";
constexpr folly::StringPiece kTreeHash = "tree_hash";
constexpr folly::StringPiece kSlug = "slug";
constexpr folly::StringPiece kRuntimes = "runtimes";
}  // anonymous namespace

bool versionLess(const std::string& a, const std::string& b) {
  std::vector<folly::StringPiece> as, bs;
  folly::split('.', a, as);
  folly::split('.', b, bs);
  for (size_t i = 0; i < std::min(as.size(), bs.size()); ++i) {
    auto an = folly::tryTo<int64_t>(as[i]);
    auto bn = folly::tryTo<int64_t>(bs[i]);
    if (an.hasValue() && bn.hasValue()) {
      if (*an != *bn) {
        return *an < *bn;
      }
    } else if (as[i] != bs[i]) {
      return as[i] < bs[i];
    }
  }
  return as.size() < bs.size();
}

bool RegistryIndex::Version::supportsRuntime(
    const std::string& runtime_version) const {
  if (runtimes.empty()) {
    return true;
  }
  folly::StringPiece rv(runtime_version);
  for (const auto& r : runtimes) {
    if (rv == r || (rv.startsWith(r) && rv.size() > r.size() &&
                    rv[r.size()] == '.')) {
      return true;
    }
  }
  return false;
}

RegistryIndex::RegistryIndex(const folly::dynamic& d) {
  folly::DynamicParser p(folly::DynamicParser::OnError::RECORD, &d);
  p.required(kPackages, [&]() {
    p.objectItems([&](const std::string& name, const folly::dynamic&) {
      auto& versions = packages_[name];
      p.required(kVersions, [&]() {
        p.objectItems([&](const std::string& ver, const folly::dynamic&) {
          Version v;
          v.version = ver;
          p.required(kTreeHash, [&](const std::string& s) {
            auto sha = parseSha1(s);
            if (!sha.has_value()) {
              throw std::runtime_error("Must be 40 hex digits");
            }
            v.treeHash = *sha;
          });
          p.optional(kSlug, [&](std::string&& s) { v.slug = std::move(s); });
          p.optional(kRuntimes, [&]() { v.runtimes = parseStringList(&p); });
          versions.emplace_back(std::move(v));
        });
      });
      std::sort(
        versions.begin(),
        versions.end(),
        [](const Version& a, const Version& b) {
          return versionLess(b.version, a.version);
        }
      );
    });
  });
  auto errors = p.releaseErrors();
  if (!errors.empty()) {
    throw PkgSweepException(
      "Invalid registry index: ", folly::toPrettyJson(errors)
    );
  }
}

FileRegistry::FileRegistry(std::string default_index)
  : defaultIndex_(std::move(default_index)) {}

std::shared_ptr<const RegistryIndex> FileRegistry::index(
    const Configuration& config) const {
  const auto& filename =
    config.registry.empty() ? defaultIndex_ : config.registry;
  if (filename.empty()) {
    throw PkgSweepException(
      "Configuration '", config.name, "' names no registry index, and no "
      "default was given"
    );
  }
  auto indexes = indexes_.wlock();
  auto it = indexes->find(filename);
  if (it != indexes->end()) {
    return it->second;
  }
  std::string contents;
  if (!folly::readFile(filename.c_str(), contents)) {
    throw PkgSweepException("Could not read ", filename, ": ", strError());
  }
  auto idx = std::make_shared<const RegistryIndex>(folly::parseJson(contents));
  LOG(INFO) << "Loaded registry index " << filename << " with "
    << idx->packages().size() << " packages";
  indexes->emplace(filename, idx);
  return idx;
}

std::vector<Package> FileRegistry::compatiblePackages(
    const Configuration& config) const {
  std::vector<Package> pkgs;
  for (const auto& name_and_versions : index(config)->packages()) {
    for (const auto& v : name_and_versions.second) {
      if (v.supportsRuntime(config.runtimeVersion)) {
        Package pkg(name_and_versions.first);
        pkg.version = v.version;
        pkgs.emplace_back(std::move(pkg));
        break;  // Newest first
      }
    }
  }
  return pkgs;
}

folly::Optional<Sha1> FileRegistry::lookupSlug(
    const Configuration& config,
    folly::StringPiece package,
    folly::StringPiece slug) const {
  auto idx = index(config);
  auto it = idx->packages().find(package.str());
  if (it == idx->packages().end()) {
    return folly::none;
  }
  for (const auto& v : it->second) {
    if (!v.slug.empty() && slug == v.slug) {
      return v.treeHash;
    }
  }
  return folly::none;
}

}}  // namespace facebook::pkgsweep
