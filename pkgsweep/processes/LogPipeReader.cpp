/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/processes/LogPipeReader.h"

#include <fcntl.h>
#include <folly/Exception.h>
#include <folly/FileUtil.h>
#include <glog/logging.h>
#include <unistd.h>

namespace facebook { namespace pkgsweep {

namespace {
constexpr size_t kReadBufSize = 16384;
}  // anonymous namespace

LogPipeReader::LogPipeReader(
    folly::EventBase* evb,
    folly::File pipe,
    uint64_t limit_bytes,
    bool echo,
    folly::Function<void()> on_overflow)
  : pipe_(std::move(pipe)),
    limitBytes_(limit_bytes),
    echo_(echo),
    onOverflow_(std::move(on_overflow)) {
  // We are the only reader of this pipe, so making it nonblocking cannot
  // surprise anyone else.
  int fd = pipe_.fd();
  int flags = ::fcntl(fd, F_GETFL);
  folly::checkUnixError(flags, "fcntl get flags");
  folly::checkUnixError(::fcntl(fd, F_SETFL, flags | O_NONBLOCK), "fcntl");
  initHandler(evb, folly::NetworkSocket::fromFd(fd));
  CHECK(registerHandler(EventHandler::READ | EventHandler::PERSIST));
}

LogPipeReader::~LogPipeReader() {
  close();
}

void LogPipeReader::drainAndClose() {
  try {
    readAvailable();
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Failed to drain output pipe: " << ex.what();
  }
  close();
}

void LogPipeReader::handlerReady(uint16_t events) noexcept {
  CHECK(events & EventHandler::READ);
  try {
    readAvailable();
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Failed to read output pipe: " << ex.what();
    close();
  }
}

void LogPipeReader::readAvailable() {
  char buf[kReadBufSize];
  while (pipe_) {
    ssize_t ret = folly::readNoInt(pipe_.fd(), buf, sizeof(buf));
    if (ret == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return;  // No more data for now
    }
    folly::checkUnixError(ret, "read");
    if (ret == 0) {
      close();
      return;
    }
    if (echo_ && folly::writeFull(STDOUT_FILENO, buf, ret) == -1) {
      PLOG(WARNING) << "Failed to echo job output";
    }
    buffer_.append(buf, ret);
    if (buffer_.size() > limitBytes_) {
      if (onOverflow_) {
        onOverflow_();
      }
      close();
      return;
    }
  }
}

void LogPipeReader::close() {
  if (!pipe_) {
    return;  // Double-close is fine
  }
  unregisterHandler();
  if (!pipe_.closeNoThrow()) {
    PLOG(ERROR) << "Failed to close output pipe";
  }
  closedPromise_.setValue();
}

}}  // namespace facebook::pkgsweep
