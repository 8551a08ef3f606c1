/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/config/parsing_common.h"

namespace facebook { namespace pkgsweep {

std::vector<std::string> parseStringList(folly::DynamicParser* p) {
  std::vector<std::string> out;
  p->arrayItems([&](std::string&& s) { out.emplace_back(std::move(s)); });
  return out;
}

std::chrono::milliseconds parsePositiveSeconds(const folly::dynamic& v) {
  if (!v.isNumber()) {
    throw std::runtime_error("Must be a number of seconds");
  }
  auto sec = v.asDouble();
  if (sec <= 0.0) {
    throw std::runtime_error("Must be positive");
  }
  return std::chrono::milliseconds(static_cast<int64_t>(1000 * sec));
}

}}  // namespace facebook::pkgsweep
