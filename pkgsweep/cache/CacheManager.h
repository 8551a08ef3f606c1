/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <folly/Synchronized.h>
#include <mutex>
#include <string>
#include <unordered_map>

#include "pkgsweep/utils/TemporaryDir.h"

namespace facebook { namespace pkgsweep {

class Configuration;
class Registry;

/**
 * Owns the caches that jobs share within one run:
 *
 *   <storage>/packages   package sources, as <package>/<slug>
 *   <storage>/artifacts  binary artifacts, named by their tree hash
 *   <storage>/compiled   compiled-code caches, one per runtime identity
 *
 * Jobs mount the shared caches read-only, and contribute new entries by
 * verifying their private copies, then merging them back via copyBack(),
 * which is the only writer.  Thread-safe.
 */
class CacheManager {
public:
  explicit CacheManager(boost::filesystem::path storage_dir);

  const boost::filesystem::path& storageDir() const { return storageDir_; }
  boost::filesystem::path packagesDir() const;
  boost::filesystem::path artifactsDir() const;

  /**
   * The compiled-code cache for every configuration whose
   * compiledCacheKey() matches `config`'s.  Made on first use, and made
   * again if it went missing.  Removed when the manager is destroyed,
   * since the code is only valid for this run's runtime builds.
   */
  boost::filesystem::path compiledDir(const Configuration& config);

  // Verifies the shared package and artifact caches, see CacheVerifier.h.
  void validate(const Registry& registry, const Configuration& config);

  /**
   * Merges the tree `src` into `dst`, creating it if needed: directories
   * are merged, files and symlinks overwrite.  Device nodes, FIFOs and
   * sockets are skipped: overlay filesystems represent deletions as
   * character devices.  Holds the storage lock, so concurrent merges
   * never interleave.  Errors are logged, and do not stop the merge.
   *
   * Returns the number of entries that could not be copied.
   */
  size_t copyBack(
    const boost::filesystem::path& src,
    const boost::filesystem::path& dst
  );

private:
  const boost::filesystem::path storageDir_;
  folly::Synchronized<std::unordered_map<std::string, TemporaryDir>>
    compiledDirs_;
  std::mutex storageMutex_;
};

}}  // namespace facebook::pkgsweep
