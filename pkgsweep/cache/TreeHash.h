/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <array>
#include <boost/filesystem/path.hpp>
#include <cstdint>
#include <folly/Optional.h>
#include <folly/Range.h>
#include <string>

namespace facebook { namespace pkgsweep {

using Sha1 = std::array<uint8_t, 20>;

// 40 hex digits, either case.  Anything else is none.
folly::Optional<Sha1> parseSha1(folly::StringPiece hex);
std::string sha1Hex(const Sha1& sha);

/**
 * Something we can hash: a symlink (never followed), a regular file, or a
 * directory all of whose entries are hashable.  Device nodes, sockets,
 * FIFOs (and character-device whiteouts left by overlay filesystems) make
 * the whole tree unhashable.  Filesystem errors are logged and yield false.
 */
bool isHashable(const boost::filesystem::path& p);

/**
 * The git tree hash of directory `dir`, which is how packages and
 * artifacts are content-addressed:
 *  - files are blobs, with mode 100755 if owner-executable, else 100644
 *  - symlinks are 120000 blobs of their target
 *  - subdirectories are 40000 trees, but empty ones are left out, since
 *    git cannot represent them
 *  - entries are ordered by name, with directory names compared as if
 *    they ended in '/'
 *
 * Throws on filesystem errors and on unhashable entries, so callers
 * normally check isHashable() first.
 */
Sha1 treeHash(const boost::filesystem::path& dir);

// Hash of the git object "<type> <size>\0<content>".
Sha1 gitObjectHash(folly::StringPiece type, folly::ByteRange content);

}}  // namespace facebook::pkgsweep
