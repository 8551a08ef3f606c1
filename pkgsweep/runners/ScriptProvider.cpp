/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/runners/ScriptProvider.h"

#include <boost/filesystem/operations.hpp>
#include <folly/FileUtil.h>
#include <glog/logging.h>

#include "pkgsweep/utils/Exception.h"

namespace facebook { namespace pkgsweep {

namespace fs = boost::filesystem;

namespace {

std::string readScript(const fs::path& path, bool required) {
  boost::system::error_code ec;
  if (!required && !fs::exists(path, ec)) {
    LOG(INFO) << "No " << path << " script, that step is unsupported";
    return "";
  }
  std::string s;
  if (!folly::readFile(path.c_str(), s)) {
    throw PkgSweepException("Could not read ", path.native(), ": ", strError());
  }
  if (required && s.empty()) {
    throw PkgSweepException("Script ", path.native(), " is empty");
  }
  return s;
}

}  // anonymous namespace

FileScriptProvider::FileScriptProvider(const fs::path& dir)
  : test_(readScript(dir / "test", /*required=*/ true)),
    compile_(readScript(dir / "compile", /*required=*/ false)),
    packTrace_(readScript(dir / "pack_trace", /*required=*/ false)) {}

}}  // namespace facebook::pkgsweep
