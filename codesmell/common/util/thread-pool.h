// Copyright 2026 The Codesmell Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef CODESMELL_COMMON_UTIL_THREAD_POOL_H_
#define CODESMELL_COMMON_UTIL_THREAD_POOL_H_

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace codesmell {

// Fixed-size thread-pool executing work items in FIFO order.
// Passing in functions, returning futures.
//
// Work that has not been picked up by a thread yet can be cancelled with
// CancelPendingWork(); its future is then fulfilled with the value of the
// 'on_cancel' function supplied at submission.  Work that has already started
// always runs to completion.
class ThreadPool {
 public:
  // Create thread pool with "thread_count" threads.
  // If that count is zero, functions will be executed synchronously.
  explicit ThreadPool(int thread_count);

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  // Cancels all pending work, then waits for running work to finish.
  ~ThreadPool();

  // Add a function returning T, that is to be executed asynchronously.
  // Return a std::future<T> with the eventual result.  If the work item is
  // cancelled before it starts, the future receives on_cancel() instead.
  //
  // As a special case: if initialized with no threads, the function is
  // executed synchronously.
  template <class T>
  [[nodiscard]] std::future<T> ExecAsync(const std::function<T()> &f,
                                         const std::function<T()> &on_cancel) {
    auto promise = std::make_shared<std::promise<T>>();
    std::future<T> future_result = promise->get_future();
    auto fulfill_with = [promise](const std::function<T()> &producer) {
      try {
        promise->set_value(producer());
      } catch (...) {
        promise->set_exception(std::current_exception());
      }
    };
    EnqueueWork({[fulfill_with, f]() { fulfill_with(f); },
                 [fulfill_with, on_cancel]() { fulfill_with(on_cancel); }});
    return future_result;
  }

  // Same, for work that has no meaningful cancellation value: a cancelled
  // future holds a default-constructed T.
  template <class T>
  [[nodiscard]] std::future<T> ExecAsync(const std::function<T()> &f) {
    return ExecAsync<T>(f, []() { return T(); });
  }

  // Removes all work items not yet started and fulfills their futures with
  // their cancellation values.  Safe to call from within a work item.
  // Returns the number of cancelled items.
  size_t CancelPendingWork();

  // Number of threads in this pool.
  size_t size() const { return threads_.size(); }

 private:
  struct WorkItem {
    std::function<void()> run;
    std::function<void()> cancel;
  };

  void Runner();
  void Shutdown();
  void EnqueueWork(WorkItem &&work);

  std::vector<std::unique_ptr<std::thread>> threads_;
  std::mutex lock_;
  std::condition_variable cv_;
  std::deque<WorkItem> work_queue_;
  bool exiting_ = false;
};

}  // namespace codesmell

#endif  // CODESMELL_COMMON_UTIL_THREAD_POOL_H_
