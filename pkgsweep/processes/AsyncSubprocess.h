/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/futures/Future.h>
#include <folly/futures/Promise.h>
#include <folly/io/async/AsyncTimeout.h>
#include <folly/Optional.h>
#include <folly/Subprocess.h>

namespace facebook { namespace pkgsweep {

namespace detail { template <typename TickCallback> class AsyncSubprocess; }

/**
 * Waits for `proc` on an EventBase without blocking it, by poll()ing every
 * `poll_ms`.  The future becomes ready with the return code once the child
 * has been reaped, and never holds an exception.
 *
 * After every poll() that finds the child still running, `tick_cob` is
 * called with the Subprocess on the EventBase thread.  It MUST be
 * noexcept, and must not block.  This is the only place where the child
 * may be signaled: a signal sent from any other thread could race the
 * waitpid() and hit a recycled PID.  A child that exits quickly may never
 * see a tick.
 *
 * The waiter owns itself and is deleted once the child is reaped.
 */
template <typename TickCallback>
folly::Future<folly::ProcessReturnCode> asyncSubprocess(
    folly::EventBase* evb,
    folly::Subprocess proc,
    TickCallback tick_cob,
    uint32_t poll_ms = 10) {
  folly::Optional<folly::Future<folly::ProcessReturnCode>> f;
  (new detail::AsyncSubprocess<TickCallback>(
    evb, std::move(proc), std::move(tick_cob), poll_ms
  ))->initialize(&f);
  return std::move(f.value());
}

namespace detail {

template <typename TickCallback>
class AsyncSubprocess : public folly::AsyncTimeout {
protected:
  friend folly::Future<folly::ProcessReturnCode> asyncSubprocess<>(
    folly::EventBase*, folly::Subprocess, TickCallback, uint32_t
  );

  AsyncSubprocess(
    folly::EventBase* evb,
    folly::Subprocess proc,
    TickCallback tick_cob,
    uint32_t poll_ms
  ) : AsyncTimeout(evb),
      pollMs_(poll_ms),
      tickCallback_(std::move(tick_cob)),
      subprocess_(std::move(proc)) {}

  // Two-stage, so that the constructor never has to `delete this`.
  void initialize(
      folly::Optional<folly::Future<folly::ProcessReturnCode>>* rc) {
    *rc = returnCode_.getFuture();
    // Unless we are on the EventBase thread, `this` may be gone as soon as
    // the timeout is scheduled.
    scheduleTimeout(pollMs_);
  }

  void timeoutExpired() noexcept override {
    auto ret = subprocess_.poll();  // Throws only on misuse.
    if (UNLIKELY(!ret.running())) {
      returnCode_.setValue(std::move(ret));
      delete this;
      return;
    }
    tickCallback_(subprocess_);
    scheduleTimeout(pollMs_);
  }

private:
  const uint32_t pollMs_;
  TickCallback tickCallback_;
  folly::Subprocess subprocess_;
  folly::Promise<folly::ProcessReturnCode> returnCode_;
};

}  // namespace detail

}}  // namespace facebook::pkgsweep
