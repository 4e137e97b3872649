/* Copyright 2025 The AI Platform Authors. All Rights Reserved.

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
==============================================================================*/

#include "common/event_queue.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "common/periodic_task.h"
#include "common/threadpool.h"

namespace ai_platform {

TEST(BoundedQueueTest, DropsNewestWhenFull) {
  BoundedQueue<int> queue(2);
  EXPECT_TRUE(queue.try_push(1));
  EXPECT_TRUE(queue.try_push(2));
  EXPECT_FALSE(queue.try_push(3));
  EXPECT_EQ(queue.dropped(), 1u);

  int item = 0;
  ASSERT_TRUE(queue.try_pop(&item));
  EXPECT_EQ(item, 1);
  ASSERT_TRUE(queue.try_pop(&item));
  EXPECT_EQ(item, 2);
  EXPECT_FALSE(queue.try_pop(&item));
}

TEST(BoundedQueueTest, PopTimesOut) {
  BoundedQueue<int> queue(1);
  int item = 0;
  EXPECT_FALSE(queue.pop(&item, absl::Milliseconds(10)));
}

TEST(BoundedQueueTest, CloseWakesBlockedConsumer) {
  BoundedQueue<int> queue(1);
  std::atomic<bool> returned{false};
  std::thread consumer([&]() {
    int item = 0;
    EXPECT_FALSE(queue.pop(&item, absl::Seconds(30)));
    returned = true;
  });
  queue.close();
  consumer.join();
  EXPECT_TRUE(returned);
  EXPECT_FALSE(queue.try_push(1));
}

TEST(EventBroadcasterTest, FansOutAndPrunesClosedSubscribers) {
  EventBroadcaster<int> broadcaster("test-events", 4);
  auto first = broadcaster.subscribe();
  auto second = broadcaster.subscribe();
  EXPECT_EQ(broadcaster.publish(7), 2u);

  second->close();
  EXPECT_EQ(broadcaster.publish(8), 1u);
  EXPECT_EQ(broadcaster.subscriber_count(), 1u);

  int item = 0;
  ASSERT_TRUE(first->try_pop(&item));
  EXPECT_EQ(item, 7);
  ASSERT_TRUE(first->try_pop(&item));
  EXPECT_EQ(item, 8);
}

TEST(EventBroadcasterTest, FullSubscriberDoesNotBlockPublisher) {
  EventBroadcaster<int> broadcaster("test-events", 1);
  auto slow = broadcaster.subscribe();
  EXPECT_EQ(broadcaster.publish(1), 1u);
  EXPECT_EQ(broadcaster.publish(2), 0u);
  EXPECT_EQ(broadcaster.dropped(), 1u);
}

TEST(EventBroadcasterTest, CloseAllClosesSubscribers) {
  EventBroadcaster<int> broadcaster("test-events", 1);
  auto queue = broadcaster.subscribe();
  broadcaster.close_all();
  EXPECT_TRUE(queue->closed());
  EXPECT_EQ(broadcaster.subscriber_count(), 0u);
}

TEST(ThreadPoolTest, RunsEveryScheduledTask) {
  std::atomic<int> counter{0};
  ThreadPool pool(3);
  for (int i = 0; i < 100; ++i) {
    pool.schedule([&counter]() { counter.fetch_add(1); });
  }
  pool.wait_idle();
  EXPECT_EQ(counter.load(), 100);
}

TEST(PeriodicTaskTest, RunsUntilStopped) {
  std::atomic<int> runs{0};
  PeriodicTask task("test-task", absl::Milliseconds(5),
                    [&runs]() { runs.fetch_add(1); });
  task.start();
  EXPECT_TRUE(task.running());
  while (runs.load() < 3) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  task.stop();
  EXPECT_FALSE(task.running());
  const int stopped_at = runs.load();
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(runs.load(), stopped_at);
}

}  // namespace ai_platform
