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

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace photolift;

TEST(ThreadPoolTest, RunsEveryTask) {
  std::atomic<int> counter{0};
  {
    ThreadPool pool(4);
    EXPECT_EQ(pool.Size(), 4u);
    for (int i = 0; i < 100; ++i) {
      pool.Submit([&counter]() { counter.fetch_add(1); });
    }
  }
  EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, ZeroThreadsStillGetsAWorker) {
  ThreadPool pool(0);
  EXPECT_EQ(pool.Size(), 1u);

  auto result = pool.Submit([]() { return 7; });
  EXPECT_EQ(result.get(), 7);
}

TEST(ThreadPoolTest, FuturesCarryResultsAndErrors) {
  ThreadPool                    pool(3);
  std::vector<std::future<int>> squares;
  for (int i = 0; i < 20; ++i) {
    squares.push_back(pool.Submit([i]() { return i * i; }));
  }
  auto failing = pool.Submit([]() -> int { throw std::runtime_error("decode failed"); });

  for (int i = 0; i < 20; ++i) {
    EXPECT_EQ(squares[i].get(), i * i);
  }
  EXPECT_THROW(failing.get(), std::runtime_error);

  // The worker that ran the failing job keeps serving
  EXPECT_EQ(pool.Submit([]() { return 1; }).get(), 1);
}

TEST(ThreadPoolTest, TasksSpreadAcrossWorkers) {
  std::mutex                lock;
  std::set<std::thread::id> seen;
  std::atomic<int>          waiting{0};
  {
    ThreadPool pool(2);
    for (int i = 0; i < 2; ++i) {
      pool.Submit([&]() {
        {
          std::lock_guard<std::mutex> guard(lock);
          seen.insert(std::this_thread::get_id());
        }
        // Hold both workers until each has picked up a task
        waiting.fetch_add(1);
        while (waiting.load() < 2) {
          std::this_thread::yield();
        }
      });
    }
  }
  EXPECT_EQ(seen.size(), 2u);
}
