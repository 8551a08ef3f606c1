/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace facebook { namespace pkgsweep {

/**
 * Owns one or more threads that each call a function in a loop, sleeping
 * for whatever duration the function returns.  Used for the progress
 * printer and the keypress listener of an Evaluation.
 *
 * Threads are added after construction (never from a constructor), and the
 * owner must stop() them before any state they touch is destroyed.  Keep
 * the BackgroundThreads member last in the owning class so that it is
 * destroyed first.
 *
 *   struct Printer {
 *     ~Printer() { threads_.stop(); }
 *     void start() {
 *       threads_.add([this]() { print(); return std::chrono::seconds(5); });
 *     }
 *     BackgroundThreads threads_;
 *   };
 */
class BackgroundThreads {
public:
  BackgroundThreads();
  virtual ~BackgroundThreads();

  /**
   * Stops and joins all threads.  Idempotent.  A function that is in the
   * middle of running is allowed to finish, so loop bodies must not block
   * for long.
   */
  void stop();

  /**
   * Called from the destructor of an owner that forgot to stop() first.
   * Logs an error, since by then the threads may have seen freed state.
   */
  void stopAndWarn(const std::string& class_of_destructor);

  /**
   * Not thread-safe, and not for use in constructors.
   *
   * Runs `f` until stop(), sleeping for the returned duration after each
   * call.  Optionally sleeps `initial_sleep` before the first call.
   */
  void add(
    std::function<std::chrono::milliseconds()> f,
    std::chrono::milliseconds initial_sleep = std::chrono::milliseconds(0)
  );

  size_t size() const { return threads_.size(); }
  bool isRunning() const { return keepRunning_.load(); }

private:
  void executeInLoop(
    std::function<std::chrono::milliseconds()> f,
    std::chrono::milliseconds initial_sleep
  ) const;

  // Sleeps in increments of FLAGS_incremental_sleep_ms, so that stop()
  // does not have to wait for the full duration.
  void incrementalSleep(std::chrono::milliseconds amount) const;

  std::atomic<bool> keepRunning_;
  std::vector<std::thread> threads_;
};

}}  // namespace facebook::pkgsweep
