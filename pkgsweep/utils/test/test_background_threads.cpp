/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "pkgsweep/utils/BackgroundThreads.h"

using namespace std;
using namespace facebook::pkgsweep;

struct Counter {
  explicit Counter(std::atomic<int>& d) : data(d) {}
  ~Counter() { threads.stop(); }

  void start() {
    threads.add([this]() {
      ++data;
      return std::chrono::milliseconds(0);
    });
  }

  std::atomic<int>& data;
  BackgroundThreads threads;
};

struct LongSleeper {
  explicit LongSleeper(std::atomic<int>& d) : data(d) {}
  ~LongSleeper() {
    threads.stop();
    data.store(-1);
  }

  void start() {
    threads.add([this]() {
      data.store(1);
      return std::chrono::seconds(300);
    });
  }

  std::atomic<int>& data;
  BackgroundThreads threads;
};

TEST(TestBackgroundThreads, Loop) {
  std::atomic<int> data(0);
  {
    Counter c(data);
    EXPECT_EQ(0, data.load());
    c.start();
    EXPECT_EQ(1U, c.threads.size());
    while (data.load() < 3) {
      this_thread::sleep_for(chrono::milliseconds(1));
    }
  }
  // The loop was stopped by the destructor.
  int val = data.load();
  this_thread::sleep_for(chrono::milliseconds(10));
  EXPECT_EQ(val, data.load());
}

TEST(TestBackgroundThreads, StopInterruptsLongSleep) {
  std::atomic<int> data(0);
  auto start = chrono::steady_clock::now();
  {
    LongSleeper s(data);
    s.start();
    while (data.load() != 1) {
      this_thread::sleep_for(chrono::milliseconds(1));
    }
  }
  EXPECT_EQ(-1, data.load());
  EXPECT_GT(chrono::seconds(60), chrono::steady_clock::now() - start);
}

TEST(TestBackgroundThreads, InitialSleepAndIdempotentStop) {
  std::atomic<int> data(0);
  BackgroundThreads threads;
  threads.add([&data]() {
    ++data;
    return std::chrono::seconds(300);
  }, std::chrono::seconds(300));
  EXPECT_TRUE(threads.isRunning());
  threads.stop();
  threads.stop();
  EXPECT_FALSE(threads.isRunning());
  // Stopped during the initial sleep, so the function never ran.
  EXPECT_EQ(0, data.load());
}
