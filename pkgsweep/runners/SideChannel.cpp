/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/runners/SideChannel.h"

#include <boost/filesystem/operations.hpp>
#include <cctype>
#include <cmath>
#include <folly/Conv.h>
#include <folly/FileUtil.h>
#include <folly/String.h>
#include <glog/logging.h>

#include "pkgsweep/utils/Exception.h"

namespace facebook { namespace pkgsweep {

namespace fs = boost::filesystem;

namespace {

template <typename T, typename ParseFn>
T readMarker(
    const fs::path& dir,
    folly::StringPiece entry,
    T default_value,
    folly::StringPiece package,
    folly::StringPiece config_name,
    ParseFn parse) {
  auto path = dir / entry.str();
  boost::system::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return default_value;
  }
  std::string contents;
  if (!folly::readFile(path.c_str(), contents)) {
    PLOG(WARNING) << "Could not read " << path;
    return default_value;
  }
  auto value = folly::trimWhitespace(contents);
  try {
    return parse(value);
  } catch (const std::exception& ex) {
    LOG(WARNING) << "Could not parse " << entry << " of " << package << " on "
      << config_name << " (got '" << value << "'): " << ex.what();
  }
  return default_value;
}

}  // anonymous namespace

SideChannel readSideChannel(
    const fs::path& output_dir,
    folly::StringPiece package,
    folly::StringPiece config_name) {
  SideChannel sc;
  sc.installed = readMarker<bool>(
    output_dir, "installed", false, package, config_name,
    [](folly::StringPiece s) {
      if (s == "true") {
        return true;
      } else if (s == "false") {
        return false;
      }
      throw PkgSweepException("Expected true or false");
    }
  );
  sc.version = readMarker<folly::Optional<std::string>>(
    output_dir, "version", folly::none, package, config_name,
    [](folly::StringPiece s) -> folly::Optional<std::string> {
      // Unversioned packages, e.g. ones bundled with the runtime.
      if (s == "nothing") {
        return folly::none;
      }
      // Also accept the runtime's literal syntax: v"1.2.3"
      if (s.removePrefix("v\"") && !s.removeSuffix("\"")) {
        throw PkgSweepException("Unterminated version literal");
      }
      if (s.empty()) {
        throw PkgSweepException("Empty version");
      }
      for (char c : s) {
        if (isspace(static_cast<unsigned char>(c)) || c == '"') {
          throw PkgSweepException("Bad character in version");
        }
      }
      return s.str();
    }
  );
  sc.duration = readMarker<double>(
    output_dir, "duration", 0.0, package, config_name,
    [](folly::StringPiece s) {
      auto d = folly::to<double>(s);
      if (!std::isfinite(d) || d < 0) {
        throw PkgSweepException("Not a valid duration");
      }
      return d;
    }
  );
  return sc;
}

}}  // namespace facebook::pkgsweep
