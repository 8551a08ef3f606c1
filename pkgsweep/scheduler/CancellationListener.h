/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <csignal>
#include <folly/io/async/AsyncSignalHandler.h>
#include <folly/io/async/EventBase.h>
#include <functional>
#include <memory>
#include <string>
#include <termios.h>
#include <thread>
#include <vector>

#include "pkgsweep/utils/BackgroundThreads.h"

namespace facebook { namespace pkgsweep {

class CancellationToken;

/**
 * Turns the outside world's requests to stop into a cancelled token:
 *
 *  - SIGINT and SIGTERM, handled on a private EventBase thread.
 *  - When stdin is a terminal and `listen_to_keys` is set, single
 *    keypresses.  The terminal goes into non-canonical mode without echo
 *    or signal generation, so Ctrl-C arrives as a byte and cannot kill
 *    the process mid-copy-back.  '?' lists what is running.
 *
 * The terminal mode is restored on destruction.
 */
class CancellationListener {
public:
  using RunningFn = std::function<std::vector<std::string>()>;

  CancellationListener(
    CancellationToken* token,
    RunningFn running,
    bool listen_to_keys
  );
  ~CancellationListener();

  CancellationListener(const CancellationListener&) = delete;
  CancellationListener& operator=(const CancellationListener&) = delete;

  bool listensToKeys() const { return rawTerminal_; }

  /**
   * Handles one byte of keyboard input: 0x03 cancels, '?' lists the
   * running jobs.  Returns false once nothing more should be read.
   */
  bool handleKey(char c);

private:
  class SignalHandler : public folly::AsyncSignalHandler {
  public:
    SignalHandler(folly::EventBase* evb, CancellationToken* token)
      : folly::AsyncSignalHandler(evb), token_(token) {
      registerSignalHandler(SIGINT);
      registerSignalHandler(SIGTERM);
    }

    void signalReceived(int sig) noexcept override;

  private:
    CancellationToken* token_;
  };

  std::chrono::milliseconds pollKeyboard();

  CancellationToken* token_;
  RunningFn running_;

  folly::EventBase evb_;
  std::unique_ptr<SignalHandler> signalHandler_;
  std::thread evbThread_;

  bool rawTerminal_{false};
  std::atomic<bool> keysDone_{false};
  struct termios savedTermios_;

  // Must be last, so that the threads stop before the state they use dies.
  BackgroundThreads threads_;
};

}}  // namespace facebook::pkgsweep
