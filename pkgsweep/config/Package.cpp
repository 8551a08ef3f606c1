/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/config/Package.h"

#include <folly/experimental/DynamicParser.h>
#include <folly/FileUtil.h>
#include <folly/json.h>

#include "pkgsweep/utils/Exception.h"

namespace facebook { namespace pkgsweep {

Package::Package(const folly::dynamic& d) {
  if (d.isString()) {
    name = d.asString();
  } else {
    folly::DynamicParser p(folly::DynamicParser::OnError::RECORD, &d);
    p.required("name", [&](std::string&& s) { name = std::move(s); });
    p.optional("version", [&](std::string&& s) { version = std::move(s); });
    p.optional("url", [&](std::string&& s) { url = std::move(s); });
    p.optional("rev", [&](std::string&& s) { rev = std::move(s); });
    auto errors = p.releaseErrors();
    if (!errors.empty()) {
      throw PkgSweepException("Invalid package: ", folly::toPrettyJson(errors));
    }
  }
  if (name.empty()) {
    throw PkgSweepException("Package names must be non-empty");
  }
}

folly::dynamic Package::toDynamic() const {
  folly::dynamic d = folly::dynamic::object("name", name);
  if (version) {
    d["version"] = *version;
  }
  if (url) {
    d["url"] = *url;
  }
  if (rev) {
    d["rev"] = *rev;
  }
  return d;
}

std::vector<Package> loadPackages(const std::string& filename) {
  std::string contents;
  if (!folly::readFile(filename.c_str(), contents)) {
    throw PkgSweepException("Could not read ", filename, ": ", strError());
  }
  auto d = folly::parseJson(contents);
  if (!d.isArray()) {
    throw PkgSweepException(filename, " must contain a JSON array");
  }
  std::vector<Package> packages;
  for (const auto& item : d) {
    packages.emplace_back(item);
  }
  return packages;
}

}}  // namespace facebook::pkgsweep
