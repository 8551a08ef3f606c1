/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <stdexcept>
#include <string>

#include <folly/Conv.h>

namespace facebook { namespace pkgsweep {

template<typename... Args>
std::runtime_error PkgSweepException(Args&&... args) {
  return
    std::runtime_error(folly::to<std::string>(std::forward<Args>(args)...));
}

/**
 * Unwinds worker loops and the job evaluation once the run's
 * CancellationToken fires.  Never recorded as a job failure.
 */
class EvaluationCancelled : public std::runtime_error {
public:
  EvaluationCancelled() : std::runtime_error("Evaluation was cancelled") {}
};

std::string strError();

}}  // namespace facebook::pkgsweep
