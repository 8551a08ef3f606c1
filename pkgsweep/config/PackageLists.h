/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/Range.h>
#include <set>
#include <string>

namespace facebook { namespace pkgsweep {

/**
 * Packages that need special treatment, known from past runs.  Each list
 * is hard-coded below, and can be extended via a comma-separated flag.
 */

// Never evaluated: recorded as skip/blacklisted (--skip_packages).
const std::set<std::string>& skippedPackages();
// Always evaluated untraced, since the tracer breaks them
// (--untraced_packages).
const std::set<std::string>& untracedPackages();
// Get twice the configured time limit (--slow_packages).
const std::set<std::string>& slowPackages();

// "A,B,,C" => {"A", "B", "C"}
std::set<std::string> parsePackageNames(folly::StringPiece s);

}}  // namespace facebook::pkgsweep
