/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <atomic>

#include "pkgsweep/utils/Exception.h"

namespace facebook { namespace pkgsweep {

/**
 * One flag per evaluation run.  Once cancelled it stays cancelled.  It is
 * polled at job-pop time, on every supervisor tick (which then stops the
 * process group), and on every progress tick.
 */
class CancellationToken {
public:
  // Returns true only for the call that actually cancelled the token, so
  // repeated requests (e.g. several Ctrl-C presses) are harmless.
  bool cancel() { return !cancelled_.exchange(true); }

  bool isCancelled() const { return cancelled_.load(); }

  void throwIfCancelled() const {
    if (isCancelled()) {
      throw EvaluationCancelled();
    }
  }

private:
  std::atomic<bool> cancelled_{false};
};

}}  // namespace facebook::pkgsweep
