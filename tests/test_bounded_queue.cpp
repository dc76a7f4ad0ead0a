//
//  test_bounded_queue.cpp
//
//  Copyright (c) 2019 2025 Andrea Bondavalli. All rights reserved.
//
//  This program is free software: you can redistribute it and/or modify
//  it under the terms of the MIT license
//
//  This program is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>

#include "bounded_queue.hpp"
#include "config.hpp"

using namespace std::chrono_literals;

class BoundedQueueTest : public ::testing::Test {
protected:
  void SetUp() override {
    Config config;
    config.set_log_severity(5);
    log_init(config);
    queue = std::make_shared<BoundedQueue<std::string>>("test", 2, log);
  }

  Logger log;
  std::shared_ptr<BoundedQueue<std::string>> queue;
};

// Test strict FIFO order
TEST_F(BoundedQueueTest, PopsInFifoOrder) {
  EXPECT_TRUE(queue->push("a", Delivery::must_deliver));
  EXPECT_TRUE(queue->push("b", Delivery::droppable));
  EXPECT_EQ(queue->size(), 2u);
  EXPECT_EQ(*queue->pop(), "a");
  EXPECT_EQ(*queue->pop(), "b");
  EXPECT_EQ(queue->size(), 0u);
}

// Test a full queue evicts the oldest droppable item
TEST_F(BoundedQueueTest, DroppableEvictsOldestDroppable) {
  EXPECT_TRUE(queue->push("final", Delivery::must_deliver));
  EXPECT_TRUE(queue->push("p1", Delivery::droppable));
  EXPECT_TRUE(queue->push("p2", Delivery::droppable));

  EXPECT_EQ(queue->dropped(), 1u);
  EXPECT_EQ(queue->dropped_finals(), 0u);
  EXPECT_EQ(*queue->pop(), "final");
  EXPECT_EQ(*queue->pop(), "p2");
}

// Test a queue full of finals drops the incoming droppable item
TEST_F(BoundedQueueTest, DroppableNeverEvictsFinals) {
  EXPECT_TRUE(queue->push("f1", Delivery::must_deliver));
  EXPECT_TRUE(queue->push("f2", Delivery::must_deliver));
  EXPECT_FALSE(queue->push("p", Delivery::droppable));

  EXPECT_EQ(queue->dropped(), 1u);
  EXPECT_EQ(*queue->pop(), "f1");
  EXPECT_EQ(*queue->pop(), "f2");
}

// Test must deliver blocks until the consumer makes room
TEST_F(BoundedQueueTest, MustDeliverBlocksWhileFull) {
  queue->push("f1", Delivery::must_deliver);
  queue->push("f2", Delivery::must_deliver);

  std::atomic_bool pushed{false};
  auto producer = std::async(std::launch::async, [&] {
    auto ok = queue->push("f3", Delivery::must_deliver);
    pushed = true;
    return ok;
  });

  std::this_thread::sleep_for(50ms);
  EXPECT_FALSE(pushed.load());

  EXPECT_EQ(*queue->pop(), "f1");
  EXPECT_TRUE(producer.get());
  EXPECT_EQ(*queue->pop(), "f2");
  EXPECT_EQ(*queue->pop(), "f3");
  EXPECT_EQ(queue->dropped_finals(), 0u);
}

// Test close lets the consumer drain, then signals end of stream
TEST_F(BoundedQueueTest, CloseDrainsPendingItems) {
  queue->push("a", Delivery::must_deliver);
  queue->close();

  EXPECT_TRUE(queue->is_closed());
  EXPECT_FALSE(queue->push("b", Delivery::must_deliver));
  EXPECT_EQ(queue->dropped_finals(), 1u);

  auto item = queue->pop();
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(*item, "a");
  EXPECT_FALSE(queue->pop().has_value());
}

// Test close wakes a consumer blocked on an empty queue
TEST_F(BoundedQueueTest, CloseWakesBlockedConsumer) {
  auto consumer =
      std::async(std::launch::async, [&] { return queue->pop().has_value(); });
  std::this_thread::sleep_for(20ms);
  queue->close();
  ASSERT_EQ(consumer.wait_for(1s), std::future_status::ready);
  EXPECT_FALSE(consumer.get());
}

// Test cancel discards pending items and releases a blocked producer
TEST_F(BoundedQueueTest, CancelDiscardsAndWakes) {
  queue->push("f1", Delivery::must_deliver);
  queue->push("p1", Delivery::droppable);

  auto producer = std::async(std::launch::async, [&] {
    return queue->push("f2", Delivery::must_deliver);
  });
  std::this_thread::sleep_for(20ms);
  queue->cancel();

  ASSERT_EQ(producer.wait_for(1s), std::future_status::ready);
  EXPECT_FALSE(producer.get());
  EXPECT_FALSE(queue->pop().has_value());
  // f1 discarded, f2 refused
  EXPECT_EQ(queue->dropped_finals(), 2u);
  EXPECT_EQ(queue->dropped(), 1u);
}

TEST_F(BoundedQueueTest, ZeroCapacityIsClampedToOne) {
  BoundedQueue<int> q("tiny", 0, log);
  EXPECT_EQ(q.capacity(), 1u);
  EXPECT_TRUE(q.push(1, Delivery::must_deliver));
  EXPECT_FALSE(q.push(2, Delivery::droppable));
}
