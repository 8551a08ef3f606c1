/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/cache/CacheVerifier.h"

#include <algorithm>
#include <boost/filesystem/operations.hpp>
#include <boost/regex.hpp>
#include <folly/Synchronized.h>
#include <gflags/gflags.h>
#include <glog/logging.h>
#include <thread>

#include "pkgsweep/cache/TreeHash.h"
#include "pkgsweep/config/Configuration.h"
#include "pkgsweep/registry/Registry.h"
#include "pkgsweep/utils/ParallelProcessor.h"
#include "pkgsweep/utils/TemporaryDir.h"

DEFINE_int32(
  cache_verify_threads, 0,
  "How many threads hash cache entries; 0 uses one per core."
);

namespace facebook { namespace pkgsweep {

namespace fs = boost::filesystem;

namespace {

struct HashCheck {
  fs::path path;
  Sha1 expected;
};

// Sorted, so that removals and logs are reproducible.
std::vector<fs::path> listDir(const fs::path& dir) {
  std::vector<fs::path> entries;
  boost::system::error_code ec;
  if (!fs::is_directory(fs::symlink_status(dir, ec))) {
    return entries;
  }
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    entries.push_back(it->path());
  }
  if (ec) {
    LOG(ERROR) << "Failed to list " << dir << ": " << ec.message();
  }
  std::sort(entries.begin(), entries.end());
  return entries;
}

bool isDir(const fs::path& p) {
  boost::system::error_code ec;
  return fs::is_directory(fs::symlink_status(p, ec));
}

// Appends the entries whose tree hash does not match to `removals`.
void checkHashes(
    std::vector<HashCheck>* checks,
    std::vector<fs::path>* removals) {
  folly::Synchronized<std::vector<fs::path>> broken;
  ParallelProcessor<HashCheck> processor(
    FLAGS_cache_verify_threads > 0
      ? FLAGS_cache_verify_threads
      : std::thread::hardware_concurrency()
  );
  processor.run(
    *checks,
    [&broken](HashCheck& c) {
      if (!isHashable(c.path) || treeHash(c.path) != c.expected) {
        VLOG(1) << "Corrupt cache entry: " << c.path;
        broken.wlock()->push_back(c.path);
      }
    },
    [&broken](HashCheck& c, const std::exception&) {
      broken.wlock()->push_back(c.path);
    }
  );
  auto b = broken.wlock();
  std::sort(b->begin(), b->end());
  removals->insert(removals->end(), b->begin(), b->end());
}

void removeAll(const std::vector<fs::path>& removals) {
  for (const auto& p : removals) {
    makeTreeRemovable(p);
    boost::system::error_code ec;
    fs::remove_all(p, ec);
    if (ec) {
      LOG(ERROR) << "Failed to remove " << p << ": " << ec.message();
    }
  }
}

}  // anonymous namespace

std::vector<fs::path> verifyArtifacts(const fs::path& dir) {
  std::vector<fs::path> removals;
  std::vector<HashCheck> checks;
  for (const auto& p : listDir(dir)) {
    auto sha = parseSha1(p.filename().string());
    if (sha.has_value()) {
      checks.push_back(HashCheck{p, *sha});
    } else {
      VLOG(1) << "Invalid artifact: " << p;
      removals.push_back(p);
    }
  }
  checkHashes(&checks, &removals);
  LOG(INFO) << "Verified " << checks.size() << " artifacts in " << dir
    << ", removing " << removals.size() << " entries";
  removeAll(removals);
  return removals;
}

std::vector<fs::path> verifyCompileCache(const fs::path& dir) {
  static const boost::regex kVersionDir(R"(v\d+\.\d+)");
  static const boost::regex kCacheFile(R"(\.(ji|so)$)", boost::regex::icase);

  std::vector<fs::path> removals;
  std::vector<fs::path> version_dirs;
  for (const auto& p : listDir(dir)) {
    if (isDir(p) && boost::regex_match(p.filename().string(), kVersionDir)) {
      version_dirs.push_back(p);
    } else {
      VLOG(1) << "Invalid compile cache version directory: " << p;
      removals.push_back(p);
    }
  }
  std::vector<fs::path> package_dirs;
  for (const auto& version_dir : version_dirs) {
    for (const auto& p : listDir(version_dir)) {
      if (isDir(p)) {
        package_dirs.push_back(p);
      } else {
        VLOG(1) << "Invalid compile cache package directory: " << p;
        removals.push_back(p);
      }
    }
  }
  for (const auto& package_dir : package_dirs) {
    for (const auto& p : listDir(package_dir)) {
      boost::system::error_code ec;
      if (!fs::is_regular_file(fs::symlink_status(p, ec)) ||
          !boost::regex_search(p.filename().string(), kCacheFile)) {
        VLOG(1) << "Invalid compile cache file: " << p;
        removals.push_back(p);
      }
    }
  }
  LOG(INFO) << "Verified compile cache " << dir << ", removing "
    << removals.size() << " entries";
  removeAll(removals);
  return removals;
}

std::vector<fs::path> removeUncacheablePackages(
    const Registry& registry,
    const Configuration& config,
    const fs::path& dir) {
  std::vector<fs::path> removals;
  std::vector<fs::path> package_dirs;
  for (const auto& p : listDir(dir)) {
    if (isDir(p)) {
      package_dirs.push_back(p);
    } else {
      VLOG(1) << "Invalid package cache entry: " << p;
      removals.push_back(p);
    }
  }
  std::vector<HashCheck> checks;
  for (const auto& package_dir : package_dirs) {
    auto package = package_dir.filename().string();
    for (const auto& p : listDir(package_dir)) {
      auto slug = p.filename().string();
      folly::Optional<Sha1> sha;
      if (isDir(p) && slug.size() >= 4 && slug.size() <= 5) {
        try {
          sha = registry.lookupSlug(config, package, slug);
        } catch (const std::exception& ex) {
          LOG(ERROR) << "Registry lookup of " << p << " failed: " << ex.what();
        }
      }
      if (sha.has_value()) {
        checks.push_back(HashCheck{p, *sha});
      } else {
        VLOG(1) << "Invalid package slug directory: " << p;
        removals.push_back(p);
      }
    }
  }
  // Build scripts first: such packages are removed even if they match.
  std::vector<HashCheck> hash_checks;
  for (auto& c : checks) {
    boost::system::error_code ec;
    if (fs::exists(fs::symlink_status(c.path / "deps" / "build.jl", ec))) {
      VLOG(1) << "Package with a build script cannot be cached: " << c.path;
      removals.push_back(c.path);
    } else {
      hash_checks.emplace_back(std::move(c));
    }
  }
  checkHashes(&hash_checks, &removals);
  LOG(INFO) << "Verified " << checks.size() << " packages in " << dir
    << ", removing " << removals.size() << " entries";
  removeAll(removals);
  return removals;
}

}}  // namespace facebook::pkgsweep
