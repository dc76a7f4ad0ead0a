//
//  bounded_queue.hpp
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

#ifndef _BOUNDED_QUEUE_HPP_
#define _BOUNDED_QUEUE_HPP_

#include <algorithm>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "log.hpp"

/* how a producer behaves when the queue is full */
enum class Delivery {
  must_deliver, // block until there is room
  droppable     // never block, the oldest droppable item gives way
};

/*
 * Small FIFO queue between two pipeline threads.
 * close() marks the end of the stream: consumers drain what is left and
 * then pop() returns nothing. cancel() wakes everybody and discards the
 * pending items.
 */
template <typename T> class BoundedQueue {
public:
  BoundedQueue(std::string name, size_t capacity, const Logger &log)
      : name_(std::move(name)), capacity_(std::max<size_t>(capacity, 1)),
        log_(log) {}
  BoundedQueue(const BoundedQueue &) = delete;
  BoundedQueue &operator=(const BoundedQueue &) = delete;

  bool push(T item, Delivery delivery) {
    if (delivery == Delivery::must_deliver) {
      return push_blocking(std::move(item));
    }

    uint64_t dropped{0};
    bool incoming_dropped{false};
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_ || cancelled_) {
        dropped = ++dropped_;
        incoming_dropped = true;
      } else if (items_.size() >= capacity_) {
        auto it = std::find_if(items_.begin(), items_.end(),
                               [](const Entry &e) { return e.droppable; });
        if (it == items_.end()) {
          incoming_dropped = true;
        } else {
          items_.erase(it);
        }
        dropped = ++dropped_;
      }
      if (!incoming_dropped) {
        items_.push_back(Entry{std::move(item), true});
        not_empty_.notify_one();
      }
    }

    if (dropped) {
      BOOST_LOG_SEV(log_, boost::log::trivial::warning)
          << "queue:: " << name_ << " overloaded, dropped "
          << (incoming_dropped ? "incoming" : "oldest")
          << " partial item, total dropped " << dropped;
    }
    return !incoming_dropped;
  }

  std::optional<T> pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock,
                    [&] { return cancelled_ || closed_ || !items_.empty(); });
    if (cancelled_ || items_.empty()) {
      return std::nullopt;
    }
    T item = std::move(items_.front().item);
    items_.pop_front();
    not_full_.notify_one();
    return item;
  }

  void close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  void cancel() {
    size_t lost{0};
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_ = true;
      for (const auto &e : items_) {
        if (e.droppable) {
          dropped_++;
        } else {
          lost++;
        }
      }
      dropped_finals_ += lost;
      items_.clear();
      not_empty_.notify_all();
      not_full_.notify_all();
    }
    if (lost) {
      BOOST_LOG_SEV(log_, boost::log::trivial::error)
          << "queue:: " << name_ << " cancelled with " << lost
          << " undelivered final items";
    }
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }
  size_t capacity() const { return capacity_; }
  bool is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ || cancelled_;
  }
  uint64_t dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
  }
  uint64_t dropped_finals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_finals_;
  }

private:
  struct Entry {
    T item;
    bool droppable;
  };

  bool push_blocking(T item) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [&] {
      return closed_ || cancelled_ || items_.size() < capacity_;
    });
    if (closed_ || cancelled_) {
      auto lost = ++dropped_finals_;
      lock.unlock();
      BOOST_LOG_SEV(log_, boost::log::trivial::error)
          << "queue:: " << name_ << " closed, final item lost, total " << lost;
      return false;
    }
    items_.push_back(Entry{std::move(item), false});
    not_empty_.notify_one();
    return true;
  }

  const std::string name_;
  const size_t capacity_;
  Logger log_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<Entry> items_;
  bool closed_{false};
  bool cancelled_{false};
  uint64_t dropped_{0};
  uint64_t dropped_finals_{0};
};

#endif
