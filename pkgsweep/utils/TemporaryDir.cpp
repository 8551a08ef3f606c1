/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/utils/TemporaryDir.h"

#include <boost/filesystem.hpp>
#include <cctype>
#include <folly/FileUtil.h>
#include <glog/logging.h>

#include "pkgsweep/utils/Exception.h"

namespace facebook { namespace pkgsweep {

namespace fs = boost::filesystem;

TemporaryDir::TemporaryDir(const fs::path& parent, const std::string& prefix)
    : path_(parent / fs::unique_path(prefix + "-%%%%-%%%%-%%%%")) {
  fs::create_directories(path_);
}

TemporaryDir::~TemporaryDir() {
  remove();
}

TemporaryDir::TemporaryDir(TemporaryDir&& other) noexcept
  : path_(std::move(other.path_)) {
  other.path_.clear();
}

TemporaryDir& TemporaryDir::operator=(TemporaryDir&& other) noexcept {
  if (this != &other) {
    remove();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

fs::path TemporaryDir::createFile(
    const std::string& name,
    const std::string& s) const {
  auto filename = path_ / name;
  if (!folly::writeFile(s, filename.c_str())) {
    throw PkgSweepException(
      "Could not write ", filename.native(), ": ", strError()
    );
  }
  return filename;
}

void TemporaryDir::remove() {
  if (path_.empty()) {
    return;
  }
  makeTreeRemovable(path_);
  boost::system::error_code ec;
  fs::remove_all(path_, ec);
  if (ec) {
    LOG(ERROR) << "Failed to remove " << path_ << ": " << ec.message();
  }
  path_.clear();
}

std::string sanitizeFileName(const std::string& name) {
  std::string s = name;
  for (auto& c : s) {
    if (!isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '.') {
      c = '_';
    }
  }
  return s;
}

void makeTreeRemovable(const fs::path& p) {
  boost::system::error_code ec;
  if (!fs::is_directory(fs::symlink_status(p, ec))) {
    return;
  }
  fs::permissions(
    p, fs::add_perms | fs::owner_all, ec
  );
  for (fs::recursive_directory_iterator it(p, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (fs::is_directory(it->symlink_status())) {
      fs::permissions(it->path(), fs::add_perms | fs::owner_all, ec);
      ec.clear();  // Keep going, remove_all will report what's left.
    }
  }
}

}}  // namespace facebook::pkgsweep
