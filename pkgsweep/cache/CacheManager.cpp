/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/cache/CacheManager.h"

#include <boost/filesystem/operations.hpp>
#include <glog/logging.h>

#include "pkgsweep/cache/CacheVerifier.h"
#include "pkgsweep/config/Configuration.h"

namespace facebook { namespace pkgsweep {

namespace fs = boost::filesystem;

namespace {

bool isDirectory(const fs::path& p) {
  boost::system::error_code ec;
  return fs::is_directory(fs::symlink_status(p, ec));
}

// `to` is about to become a file or symlink.  Never write through a
// symlink at the destination.
void clearDestination(const fs::path& to) {
  auto st = fs::symlink_status(to);
  if (fs::is_directory(st)) {
    fs::remove_all(to);
  } else if (fs::exists(st)) {
    fs::remove(to);
  }
}

size_t mergeTree(const fs::path& src, const fs::path& dst) {
  boost::system::error_code ec;
  fs::create_directories(dst, ec);
  if (ec) {
    LOG(ERROR) << "Failed to create " << dst << ": " << ec.message();
    return 1;
  }
  size_t errors = 0;
  for (fs::directory_iterator it(src, ec), end; !ec && it != end;
       it.increment(ec)) {
    const auto& from = it->path();
    auto to = dst / from.filename();
    try {
      auto st = fs::symlink_status(from);
      if (fs::is_directory(st)) {
        if (fs::exists(fs::symlink_status(to)) && !isDirectory(to)) {
          fs::remove(to);
        }
        errors += mergeTree(from, to);
      } else if (fs::is_symlink(st)) {
        clearDestination(to);
        fs::copy_symlink(from, to);
      } else if (fs::is_regular_file(st)) {
        clearDestination(to);
        fs::copy_file(from, to, fs::copy_options::overwrite_existing);
        fs::last_write_time(to, fs::last_write_time(from));
      } else {
        VLOG(1) << "Not copying special file " << from;
      }
    } catch (const fs::filesystem_error& ex) {
      LOG(ERROR) << "Failed to copy " << from << " to " << to << ": "
        << ex.what();
      ++errors;
    }
  }
  if (ec) {
    LOG(ERROR) << "Failed to list " << src << ": " << ec.message();
    ++errors;
  }
  return errors;
}

}  // anonymous namespace

CacheManager::CacheManager(fs::path storage_dir)
  : storageDir_(std::move(storage_dir)) {
  fs::create_directories(packagesDir());
  fs::create_directories(artifactsDir());
  fs::create_directories(storageDir_ / "compiled");
}

fs::path CacheManager::packagesDir() const {
  return storageDir_ / "packages";
}

fs::path CacheManager::artifactsDir() const {
  return storageDir_ / "artifacts";
}

fs::path CacheManager::compiledDir(const Configuration& config) {
  auto key = config.compiledCacheKey();
  auto dirs = compiledDirs_.wlock();
  auto it = dirs->find(key);
  if (it != dirs->end()) {
    if (isDirectory(it->second.getPath())) {
      return it->second.getPath();
    }
    LOG(WARNING) << "Compiled cache " << it->second.getPath() << " of "
      << config.name << " went missing, making a new one";
    dirs->erase(it);
  }
  auto res = dirs->emplace(key, TemporaryDir(
    storageDir_ / "compiled", sanitizeFileName(config.name) + "-compiled"
  ));
  LOG(INFO) << "Compiled cache for " << config.name << ": "
    << res.first->second.getPath();
  return res.first->second.getPath();
}

void CacheManager::validate(
    const Registry& registry,
    const Configuration& config) {
  removeUncacheablePackages(registry, config, packagesDir());
  verifyArtifacts(artifactsDir());
}

size_t CacheManager::copyBack(const fs::path& src, const fs::path& dst) {
  if (!isDirectory(src)) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(storageMutex_);
  auto errors = mergeTree(src, dst);
  if (errors) {
    LOG(WARNING) << "Failed to copy " << errors << " entries from " << src
      << " to " << dst;
  }
  return errors;
}

}}  // namespace facebook::pkgsweep
