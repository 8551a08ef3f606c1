/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <string>

namespace facebook { namespace pkgsweep {

/**
 * A uniquely named directory, removed recursively on destruction.  Jobs
 * use one as their working directory.  Removal failures are logged, since
 * a job may leave behind files it cannot remove (e.g. read-only trees).
 */
class TemporaryDir {
public:
  explicit TemporaryDir(
    const boost::filesystem::path& parent =
      boost::filesystem::temp_directory_path(),
    const std::string& prefix = "pkgsweep"
  );
  ~TemporaryDir();

  TemporaryDir(TemporaryDir&&) noexcept;
  TemporaryDir& operator=(TemporaryDir&&) noexcept;
  TemporaryDir(const TemporaryDir&) = delete;
  TemporaryDir& operator=(const TemporaryDir&) = delete;

  const boost::filesystem::path& getPath() const { return path_; }

  // Writes `s` to a new file under this directory, returning its path.
  boost::filesystem::path createFile(
    const std::string& name,
    const std::string& s = ""
  ) const;

private:
  void remove();

  boost::filesystem::path path_;
};

// Replaces the characters of `name` that do not belong in a file name
// prefix (anything but [A-Za-z0-9.-]) with '_'.
std::string sanitizeFileName(const std::string& name);

// Makes every entry under `p` owner-writable and traversable, so that a
// tree with read-only directories can be removed.
void makeTreeRemovable(const boost::filesystem::path& p);

}}  // namespace facebook::pkgsweep
