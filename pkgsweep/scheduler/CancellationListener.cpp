/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/scheduler/CancellationListener.h"

#include <cerrno>
#include <folly/String.h>
#include <glog/logging.h>
#include <memory>
#include <poll.h>
#include <unistd.h>

#include "pkgsweep/utils/CancellationToken.h"

namespace facebook { namespace pkgsweep {

void CancellationListener::SignalHandler::signalReceived(int sig) noexcept {
  if (token_->cancel()) {
    LOG(ERROR) << "Got signal " << sig << ", stopping the evaluation.";
  } else {
    LOG(WARNING) << "Got signal " << sig << ", already stopping.";
  }
}

CancellationListener::CancellationListener(
    CancellationToken* token,
    RunningFn running,
    bool listen_to_keys)
  : token_(token), running_(std::move(running)) {

  signalHandler_ = std::make_unique<SignalHandler>(&evb_, token_);
  evbThread_ = std::thread([this]() { evb_.loopForever(); });
  evb_.waitUntilRunning();

  if (listen_to_keys && ::isatty(STDIN_FILENO)) {
    if (::tcgetattr(STDIN_FILENO, &savedTermios_) != 0) {
      PLOG(WARNING) << "Cannot read the terminal mode, not listening to keys";
    } else {
      struct termios raw = savedTermios_;
      raw.c_lflag &= ~(ICANON | ECHO | ISIG);
      raw.c_cc[VMIN] = 1;
      raw.c_cc[VTIME] = 0;
      if (::tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0) {
        PLOG(WARNING) << "Cannot set the terminal mode, not listening to keys";
      } else {
        rawTerminal_ = true;
        LOG(INFO) << "Press Ctrl-C to stop, or ? to list running jobs";
        threads_.add([this]() { return pollKeyboard(); });
      }
    }
  }
}

CancellationListener::~CancellationListener() {
  threads_.stop();
  if (rawTerminal_ &&
      ::tcsetattr(STDIN_FILENO, TCSANOW, &savedTermios_) != 0) {
    PLOG(ERROR) << "Failed to restore the terminal mode";
  }
  evb_.terminateLoopSoon();
  evbThread_.join();
  // The loop has exited, so the handler is torn down outside of it.
  signalHandler_.reset();
}

bool CancellationListener::handleKey(char c) {
  if (c == '\x03') {
    LOG(WARNING) << "Caught Ctrl-C, stopping...";
    token_->cancel();
    return false;
  }
  if (c == '?') {
    LOG(INFO) << "Currently running: " << folly::join(", ", running_());
  }
  return true;
}

std::chrono::milliseconds CancellationListener::pollKeyboard() {
  const std::chrono::milliseconds kPollInterval(100);
  if (keysDone_.load()) {
    return std::chrono::hours(1);  // stop() wakes us up
  }
  struct pollfd pfd;
  pfd.fd = STDIN_FILENO;
  pfd.events = POLLIN;
  pfd.revents = 0;
  int ready = ::poll(&pfd, 1, 0);
  if (ready < 0) {
    if (errno != EINTR) {
      PLOG(WARNING) << "Polling the keyboard failed, not listening to keys";
      keysDone_.store(true);
    }
    return kPollInterval;
  }
  if (ready == 0) {
    return kPollInterval;
  }
  char buf[64];
  auto n = ::read(STDIN_FILENO, buf, sizeof(buf));
  if (n < 0) {
    if (errno != EINTR && errno != EAGAIN) {
      PLOG(WARNING) << "Reading the keyboard failed, not listening to keys";
      keysDone_.store(true);
    }
    return kPollInterval;
  }
  if (n == 0) {
    keysDone_.store(true);  // EOF
    return kPollInterval;
  }
  for (ssize_t i = 0; i < n; ++i) {
    if (!handleKey(buf[i])) {
      keysDone_.store(true);
      break;
    }
  }
  return kPollInterval;
}

}}  // namespace facebook::pkgsweep
