/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/utils/Exception.h"

#include <cstring>
#include <glog/logging.h>

namespace facebook { namespace pkgsweep {

std::string strError() {
  char buf[512];
  // GNU strerror_r, which may return a static string instead of `buf`.
  const char* error = strerror_r(errno, buf, sizeof(buf));
  PCHECK(error != nullptr) << "strerror_r failed";
  return std::string(error);
}

}}  // namespace facebook::pkgsweep
