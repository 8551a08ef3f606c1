/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <functional>
#include <glog/logging.h>
#include <thread>
#include <vector>

namespace facebook { namespace pkgsweep {

/**
 * Applies a callback to every item of a container using a fixed number of
 * threads, which claim items through a shared atomic index.  Blocks until
 * all items are processed.
 *
 * The callback must be safe to run concurrently on distinct items.  If it
 * throws, the error is logged and `on_error` (if any) runs for that item,
 * so that callers can treat an unexpected failure conservatively.
 */
template<class Item, class Container = std::vector<Item>>
class ParallelProcessor {
public:
  using Callback = std::function<void(Item&)>;
  using ErrorCallback = std::function<void(Item&, const std::exception&)>;

  explicit ParallelProcessor(
      int num_threads = std::thread::hardware_concurrency())
    : numThreads_(num_threads <= 0 ? 8 : num_threads) {
    CHECK_GE(numThreads_, 1);
  }

  void run(Container& c, Callback cob, ErrorCallback on_error = nullptr) {
    std::atomic<size_t> index(0);
    auto work = [&]() {
      for (size_t k = index.fetch_add(1); k < c.size(); k = index.fetch_add(1)) {
        try {
          cob(c.at(k));
        } catch (const std::exception& e) {
          LOG(ERROR) << "Error running callback: " << e.what();
          if (on_error) {
            on_error(c.at(k), e);
          }
        }
      }
    };
    std::vector<std::thread> threads;
    const size_t num_threads = std::min<size_t>(numThreads_, c.size());
    for (size_t i = 1; i < num_threads; ++i) {
      threads.emplace_back(work);
    }
    work();  // The calling thread takes a share of the items too.
    for (auto& t : threads) {
      t.join();
    }
  }

private:
  const int numThreads_;
};

}}  // namespace facebook::pkgsweep
