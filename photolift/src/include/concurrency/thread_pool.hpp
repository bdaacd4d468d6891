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

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace photolift {
/**
 * @brief Fixed set of workers draining a FIFO queue. Every submitted job hands back a
 * std::future for its return value, and exceptions thrown by the job surface from get().
 *
 * Destruction stops intake, lets the queued jobs finish and joins the workers.
 */
class ThreadPool {
 private:
  std::vector<std::thread>          _workers;
  std::deque<std::function<void()>> _queue;
  std::mutex                        _mutex;
  std::condition_variable           _ready;
  bool                              _stopping = false;

  void                              Enqueue(std::function<void()> job);
  void                              WorkerLoop();

 public:
  explicit ThreadPool(size_t thread_count);
  ~ThreadPool();

  ThreadPool(const ThreadPool&)            = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  /**
   * @brief Queue a job
   *
   * @throws std::runtime_error once the pool is shutting down
   */
  template <typename Fn>
  auto Submit(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
    using result_t = std::invoke_result_t<std::decay_t<Fn>>;
    // std::function needs a copyable target, so the packaged_task is shared
    auto job       = std::make_shared<std::packaged_task<result_t()>>(std::forward<Fn>(fn));
    auto future    = job->get_future();
    Enqueue([job]() { (*job)(); });
    return future;
  }

  auto Size() const -> size_t { return _workers.size(); }
};
};  // namespace photolift
