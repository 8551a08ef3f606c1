/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/File.h>
#include <folly/Function.h>
#include <folly/futures/Future.h>
#include <folly/futures/Promise.h>
#include <folly/io/async/EventHandler.h>
#include <string>

namespace facebook { namespace pkgsweep {

/**
 * Accumulates everything written to the read end of a pipe, optionally
 * echoing it to our stdout, until EOF or until the accumulated size
 * exceeds `limit_bytes`.  On overflow, `on_overflow` runs and the pipe is
 * closed, so the buffer ends up at most one read past the limit.
 *
 * Unlike a self-owned handler, this must outlive its EventBase loop, and
 * all methods except pipeClosed() must be called from the EventBase
 * thread.  ProcessSupervisor keeps one on the stack of the thread that
 * runs the loop.
 */
class LogPipeReader : public folly::EventHandler {
public:
  LogPipeReader(
    folly::EventBase* evb,
    folly::File pipe,
    uint64_t limit_bytes,
    bool echo,
    folly::Function<void()> on_overflow
  );
  ~LogPipeReader() override;

  LogPipeReader(const LogPipeReader&) = delete;
  LogPipeReader& operator=(const LogPipeReader&) = delete;

  // Ready once the pipe is closed, for any reason.
  folly::Future<folly::Unit> pipeClosed() {
    return closedPromise_.getFuture();
  }

  bool isClosed() const { return !pipe_; }

  // Reads what is available without blocking, then closes the pipe.  Used
  // once the writer is dead, since orphaned grandchildren may hold the
  // write end open indefinitely.
  void drainAndClose();

  std::string& buffer() { return buffer_; }

private:
  void handlerReady(uint16_t events) noexcept override;
  void readAvailable();
  void close();

  folly::File pipe_;
  const uint64_t limitBytes_;
  const bool echo_;
  folly::Function<void()> onOverflow_;
  std::string buffer_;
  folly::Promise<folly::Unit> closedPromise_;
};

}}  // namespace facebook::pkgsweep
