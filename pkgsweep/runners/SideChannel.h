/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <folly/Optional.h>
#include <folly/Range.h>
#include <string>

namespace facebook { namespace pkgsweep {

/**
 * Structured facts that the job script reports through marker files in
 * its output directory, instead of us parsing them from the log:
 *
 *   installed  "true" or "false", whether the package installed
 *   version    the resolved package version, or "nothing" if it has none
 *   duration   seconds spent testing, as a decimal number
 *
 * Missing markers take the defaults below.  So do unparseable ones, with
 * a warning, since a broken job must never break the evaluation.
 */
struct SideChannel {
  bool installed{false};
  folly::Optional<std::string> version;
  double duration{0.0};
};

// `package` and `config_name` only label the warnings.
SideChannel readSideChannel(
  const boost::filesystem::path& output_dir,
  folly::StringPiece package,
  folly::StringPiece config_name
);

}}  // namespace facebook::pkgsweep
