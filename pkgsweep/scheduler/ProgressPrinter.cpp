/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "pkgsweep/scheduler/ProgressPrinter.h"

#include <algorithm>
#include <folly/Conv.h>
#include <folly/Format.h>
#include <glog/logging.h>
#include <iostream>

#include "pkgsweep/utils/CancellationToken.h"

namespace facebook { namespace pkgsweep {

namespace {
const std::chrono::milliseconds kMaxBackoff(300000);
}  // anonymous namespace

std::string progressBar(const ProgressSnapshot& s, size_t bar_width) {
  size_t done = std::min(s.completed, s.totalJobs);
  double frac = s.totalJobs ? double(done) / s.totalJobs : 1.0;
  size_t filled = static_cast<size_t>(frac * bar_width);
  auto line = folly::format(
    "Running tests: {:3d}%|{}{}| {}/{} [ok {}, fail {}, crash {}, kill {}]",
    static_cast<int>(frac * 100),
    std::string(filled, '#'),
    std::string(bar_width - filled, ' '),
    done,
    s.totalJobs,
    s.ok,
    s.fail,
    s.crash,
    s.kill
  ).str();
  auto eta = estimateRemainingSec(
    s.totalJobs, s.completed, s.elapsedSec, s.running
  );
  if (eta.hasValue()) {
    line += " ETA: " + formatDuration(*eta);
  }
  return line;
}

std::string progressLine(const ProgressSnapshot& s) {
  auto remaining = s.totalJobs > s.completed ? s.totalJobs - s.completed : 0;
  auto line = folly::to<std::string>("Running tests: ", remaining, " remaining");
  auto eta = estimateRemainingSec(
    s.totalJobs, s.completed, s.elapsedSec, s.running
  );
  if (eta.hasValue()) {
    line += " (ETA: " + formatDuration(*eta) + ")";
  }
  return line;
}

ProgressPrinter::ProgressPrinter(
    SnapshotFn snapshot,
    const CancellationToken* token,
    bool interactive)
  : snapshot_(std::move(snapshot)), token_(token), interactive_(interactive) {
}

ProgressPrinter::~ProgressPrinter() {
  stop();
}

void ProgressPrinter::start() {
  threads_.add([this]() { return tick(); });
}

void ProgressPrinter::stop() {
  threads_.stop();
  if (stopped_) {
    return;
  }
  stopped_ = true;
  if (interactive_) {
    std::cerr << "\r\033[K" << progressBar(snapshot_()) << std::endl;
  }
}

std::chrono::milliseconds ProgressPrinter::tick() {
  if (token_ && token_->isCancelled()) {
    return std::chrono::seconds(1);
  }
  if (interactive_) {
    std::cerr << "\r\033[K" << progressBar(snapshot_()) << std::flush;
    return std::chrono::seconds(1);
  }
  LOG(INFO) << progressLine(snapshot_());
  auto sleep = sleep_;
  if (sleep_ < kMaxBackoff) {
    sleep_ = std::chrono::milliseconds(
      static_cast<int64_t>(sleep_.count() * 1.5)
    );
  }
  return sleep;
}

}}  // namespace facebook::pkgsweep
