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

#include "codesmell/common/util/thread-pool.h"

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

namespace codesmell {

ThreadPool::ThreadPool(int thread_count) {
  for (int i = 0; i < thread_count; ++i) {
    threads_.push_back(
        std::make_unique<std::thread>(&ThreadPool::Runner, this));
  }
}

ThreadPool::~ThreadPool() {
  CancelPendingWork();
  Shutdown();
  for (auto &t : threads_) {
    t->join();
  }
}

void ThreadPool::Runner() {
  WorkItem item;
  for (;;) {
    {
      std::unique_lock<std::mutex> l(lock_);
      cv_.wait(l, [this]() { return !work_queue_.empty() || exiting_; });
      if (work_queue_.empty()) return;  // exiting_ and nothing left.
      item = std::move(work_queue_.front());
      work_queue_.pop_front();
    }
    item.run();
  }
}

void ThreadPool::EnqueueWork(WorkItem &&work) {
  if (threads_.empty()) {
    work.run();  // synchronous execution
    return;
  }

  {
    std::unique_lock<std::mutex> l(lock_);
    work_queue_.emplace_back(std::move(work));
  }
  cv_.notify_one();
}

size_t ThreadPool::CancelPendingWork() {
  std::deque<WorkItem> cancelled;
  {
    std::unique_lock<std::mutex> l(lock_);
    cancelled.swap(work_queue_);
  }
  // Fulfill outside the lock: cancellation values may be arbitrary code.
  for (auto &item : cancelled) {
    item.cancel();
  }
  return cancelled.size();
}

void ThreadPool::Shutdown() {
  {
    std::unique_lock<std::mutex> l(lock_);
    exiting_ = true;
  }
  cv_.notify_all();
}

}  // namespace codesmell
