/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/utils/signal.h"

#include <folly/Conv.h>
#include <signal.h>
#include <string.h>

namespace facebook { namespace pkgsweep {

std::string describeSignal(int sig) {
#if defined(__GLIBC__) && (__GLIBC__ > 2 || __GLIBC_MINOR__ >= 32)
  // sigdescr_np is thread-safe, unlike strsignal().
  if (auto desc = sigdescr_np(sig)) {
    return desc;
  }
#else
  if (sig > 0 && sig < NSIG && ::sys_siglist[sig]) {
    return ::sys_siglist[sig];
  }
#endif
  return folly::to<std::string>("Unknown signal: ", sig);
}

}}  // namespace facebook::pkgsweep
