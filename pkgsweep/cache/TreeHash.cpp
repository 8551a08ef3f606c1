/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/cache/TreeHash.h"

#include <algorithm>
#include <boost/filesystem/operations.hpp>
#include <fcntl.h>
#include <folly/Conv.h>
#include <folly/Exception.h>
#include <folly/File.h>
#include <folly/FileUtil.h>
#include <folly/Range.h>
#include <folly/String.h>
#include <folly/ssl/OpenSSLHash.h>
#include <glog/logging.h>
#include <openssl/evp.h>
#include <vector>

#include "pkgsweep/utils/Exception.h"

namespace facebook { namespace pkgsweep {

namespace fs = boost::filesystem;

namespace {

constexpr size_t kFileChunkSize = 1 << 16;

struct TreeEntry {
  std::string sortKey;  // Directories sort as "name/"
  std::string name;
  folly::StringPiece mode;
  Sha1 hash;
};

void startObject(
    folly::ssl::OpenSSLHash::Digest* digest,
    folly::StringPiece type,
    uint64_t size) {
  digest->hash_init(EVP_sha1());
  auto header = folly::to<std::string>(type, ' ', size);
  header.push_back('\0');
  digest->hash_update(folly::ByteRange(folly::StringPiece(header)));
}

Sha1 finishObject(folly::ssl::OpenSSLHash::Digest* digest) {
  Sha1 sha;
  digest->hash_final(folly::MutableByteRange(sha.data(), sha.size()));
  return sha;
}

// Streams the file, since artifacts can be large.
Sha1 blobHashOfFile(const fs::path& p) {
  folly::File f(p.string(), O_RDONLY | O_CLOEXEC);
  auto size = fs::file_size(p);
  folly::ssl::OpenSSLHash::Digest digest;
  startObject(&digest, "blob", size);
  std::vector<uint8_t> buf(kFileChunkSize);
  uint64_t total = 0;
  while (true) {
    auto n = folly::readNoInt(f.fd(), buf.data(), buf.size());
    folly::checkUnixError(n, "Reading ", p.string());
    if (n == 0) {
      break;
    }
    total += n;
    digest.hash_update(folly::ByteRange(buf.data(), n));
  }
  if (total != size) {
    throw PkgSweepException(
      p.string(), " changed while hashing: expected ", size, " bytes, read ",
      total
    );
  }
  return finishObject(&digest);
}

const Sha1& emptyTreeHash() {
  static const Sha1 kEmptyTree = gitObjectHash("tree", folly::ByteRange());
  return kEmptyTree;
}

}  // anonymous namespace

folly::Optional<Sha1> parseSha1(folly::StringPiece hex) {
  if (hex.size() != 2 * Sha1().size()) {
    return folly::none;
  }
  std::string bytes;
  if (!folly::unhexlify(hex, bytes)) {
    return folly::none;
  }
  Sha1 sha;
  std::copy(bytes.begin(), bytes.end(), sha.begin());
  return sha;
}

std::string sha1Hex(const Sha1& sha) {
  std::string hex;
  CHECK(folly::hexlify(folly::ByteRange(sha.data(), sha.size()), hex));
  return hex;
}

Sha1 gitObjectHash(folly::StringPiece type, folly::ByteRange content) {
  folly::ssl::OpenSSLHash::Digest digest;
  startObject(&digest, type, content.size());
  digest.hash_update(content);
  return finishObject(&digest);
}

bool isHashable(const fs::path& p) {
  try {
    auto st = fs::symlink_status(p);
    if (fs::is_symlink(st)) {
      return true;
    }
    if (fs::is_directory(st)) {
      for (fs::directory_iterator it(p), end; it != end; ++it) {
        if (!isHashable(it->path())) {
          return false;
        }
      }
      return true;
    }
    return fs::is_regular_file(st);
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Encountered broken filesystem entry " << p << ": "
      << ex.what();
    return false;
  }
}

Sha1 treeHash(const fs::path& dir) {
  if (!fs::is_directory(fs::symlink_status(dir))) {
    throw PkgSweepException("Cannot take tree hash of ", dir.string());
  }
  std::vector<TreeEntry> entries;
  for (fs::directory_iterator it(dir), end; it != end; ++it) {
    const auto& p = it->path();
    TreeEntry e;
    e.name = p.filename().string();
    e.sortKey = e.name;
    auto st = fs::symlink_status(p);
    if (fs::is_symlink(st)) {
      e.mode = "120000";
      auto target = fs::read_symlink(p).string();
      e.hash =
        gitObjectHash("blob", folly::ByteRange(folly::StringPiece(target)));
    } else if (fs::is_directory(st)) {
      e.hash = treeHash(p);
      if (e.hash == emptyTreeHash()) {
        continue;
      }
      e.mode = "40000";
      e.sortKey.push_back('/');
    } else if (fs::is_regular_file(st)) {
      e.mode = (st.permissions() & fs::owner_exe) ? "100755" : "100644";
      e.hash = blobHashOfFile(p);
    } else {
      throw PkgSweepException(
        "Cannot hash ", p.string(), ": not a file, directory or symlink"
      );
    }
    entries.emplace_back(std::move(e));
  }
  std::sort(
    entries.begin(),
    entries.end(),
    [](const TreeEntry& a, const TreeEntry& b) { return a.sortKey < b.sortKey; }
  );
  std::string content;
  for (const auto& e : entries) {
    folly::toAppend(e.mode, ' ', e.name, &content);
    content.push_back('\0');
    folly::StringPiece raw(folly::ByteRange(e.hash.data(), e.hash.size()));
    content.append(raw.data(), raw.size());
  }
  return gitObjectHash("tree", folly::ByteRange(folly::StringPiece(content)));
}

}}  // namespace facebook::pkgsweep
