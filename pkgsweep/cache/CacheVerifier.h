/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <vector>

namespace facebook { namespace pkgsweep {

class Configuration;
class Registry;

/**
 * Pruning of the shared caches, which concurrent jobs may corrupt.  Each
 * verifier lists candidates sequentially, checks them on
 * --cache_verify_threads threads, and then deletes the bad ones one by
 * one.  Nothing here throws for a single bad entry: an entry whose check
 * fails unexpectedly is logged and removed, and a failed removal is
 * logged and skipped.
 *
 * All return the paths they removed, or tried to remove.  A missing cache
 * directory is simply empty.
 */

/**
 * Artifact cache: every top-level entry must be named by the tree hash of
 * its contents.  Misnamed entries are removed without being read.
 */
std::vector<boost::filesystem::path> verifyArtifacts(
  const boost::filesystem::path& dir
);

/**
 * Compiled-code cache, structure only: `vX.Y` version directories, then
 * package directories, then .ji / .so files (in any case).  The contents
 * are regenerable, so they are not hashed.
 */
std::vector<boost::filesystem::path> verifyCompileCache(
  const boost::filesystem::path& dir
);

/**
 * Package source cache: `<package>/<slug>` directories whose slug (4 or 5
 * characters) the registry maps to a tree hash, which the contents must
 * match.  Packages with a build script (deps/build.jl) are never cached,
 * since a cache hit would skip the build.
 */
std::vector<boost::filesystem::path> removeUncacheablePackages(
  const Registry& registry,
  const Configuration& config,
  const boost::filesystem::path& dir
);

}}  // namespace facebook::pkgsweep
