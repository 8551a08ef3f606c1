/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

/**
 * Parsers shared by Configuration, Package and the registry index.
 */

#include <chrono>
#include <folly/experimental/DynamicParser.h>
#include <string>
#include <vector>

namespace facebook { namespace pkgsweep {

// Parses the current DynamicParser value as an array of strings.  Bad
// items are recorded as errors on the parser.
std::vector<std::string> parseStringList(folly::DynamicParser* p);

// Seconds (integer or fractional) to milliseconds, throwing unless > 0.
std::chrono::milliseconds parsePositiveSeconds(const folly::dynamic& v);

}}  // namespace facebook::pkgsweep
