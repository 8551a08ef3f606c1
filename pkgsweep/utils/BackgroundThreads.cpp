/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/utils/BackgroundThreads.h"

#include <algorithm>

#include <gflags/gflags.h>
#include <glog/logging.h>

// Exposed so that tests can shut down background loops quickly.
DEFINE_int32(
  incremental_sleep_ms, 200,
  "Background loops wake up this often to check whether they should exit."
);

namespace facebook { namespace pkgsweep {

BackgroundThreads::BackgroundThreads() : keepRunning_(true) {
}

BackgroundThreads::~BackgroundThreads() {
  stopAndWarn("BackgroundThreads");
}

void BackgroundThreads::stopAndWarn(const std::string& class_of_destructor) {
  if (keepRunning_.load() && !threads_.empty()) {
    LOG(ERROR) << "BackgroundThreads::stop() was not called before the "
      << class_of_destructor << " destructor, so its background loops may "
      << "have accessed destroyed state.";
  }
  stop();
}

void BackgroundThreads::stop() {
  if (keepRunning_.exchange(false)) {  // Only the first caller joins.
    for (auto& t : threads_) {
      t.join();
    }
  }
}

void BackgroundThreads::add(
    std::function<std::chrono::milliseconds()> f,
    std::chrono::milliseconds initial_sleep) {
  CHECK(keepRunning_.load()) << "Cannot add threads after stop()";
  threads_.emplace_back(
    &BackgroundThreads::executeInLoop, this, std::move(f), initial_sleep
  );
}

void BackgroundThreads::executeInLoop(
    std::function<std::chrono::milliseconds()> f,
    std::chrono::milliseconds initial_sleep) const {
  incrementalSleep(initial_sleep);
  while (keepRunning_.load()) {
    incrementalSleep(f());
  }
}

void BackgroundThreads::incrementalSleep(
    std::chrono::milliseconds amount) const {
  const std::chrono::milliseconds increment(
    std::max(1, FLAGS_incremental_sleep_ms)
  );
  while (amount.count() > 0 && keepRunning_.load()) {
    auto s = std::min(amount, increment);
    std::this_thread::sleep_for(s);
    amount -= s;
  }
}

}}  // namespace facebook::pkgsweep
