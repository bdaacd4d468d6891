//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "concurrency/thread_pool.hpp"

#include <algorithm>
#include <stdexcept>

namespace photolift {
ThreadPool::ThreadPool(size_t thread_count) {
  const size_t count = std::max<size_t>(1, thread_count);
  _workers.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    _workers.emplace_back([this]() { WorkerLoop(); });
  }
}

ThreadPool::~ThreadPool() {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _stopping = true;
  }
  _ready.notify_all();
  for (auto& worker : _workers) {
    if (worker.joinable()) worker.join();
  }
}

void ThreadPool::Enqueue(std::function<void()> job) {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_stopping) {
      throw std::runtime_error("ThreadPool: pool is shutting down");
    }
    _queue.push_back(std::move(job));
  }
  _ready.notify_one();
}

void ThreadPool::WorkerLoop() {
  for (;;) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(_mutex);
      _ready.wait(lock, [this]() { return _stopping || !_queue.empty(); });
      // Drain what is queued before honoring the stop request
      if (_queue.empty()) return;
      job = std::move(_queue.front());
      _queue.pop_front();
    }
    // packaged_task stores any exception in the job's future
    job();
  }
}
};  // namespace photolift
