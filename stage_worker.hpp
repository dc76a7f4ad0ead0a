//
//  stage_worker.hpp
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

#ifndef _STAGE_WORKER_HPP_
#define _STAGE_WORKER_HPP_

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "bounded_queue.hpp"
#include "log.hpp"
#include "stage_result.hpp"

/*
 * One pipeline stage on its own thread: pops an item, hands it to
 * process(), forwards what it produces through the sink.
 * Must be owned by a shared_ptr, the thread keeps the worker alive so that
 * a worker abandoned at shutdown never touches freed memory.
 */
template <typename Input, typename Output>
class StageWorker
    : public std::enable_shared_from_this<StageWorker<Input, Output>> {
public:
  using InputQueue = BoundedQueue<Input>;
  /* returns false once the downstream no longer accepts items */
  using Sink = std::function<bool(Output &&item)>;

  StageWorker(std::string name, std::shared_ptr<InputQueue> input,
              const Logger &log)
      : log_(log), name_(std::move(name)), input_(std::move(input)) {}
  StageWorker(const StageWorker &) = delete;
  virtual ~StageWorker() {
    if (thread_.joinable()) {
      thread_.detach();
    }
  }

  void set_sink(Sink sink) { sink_ = std::move(sink); }
  /* runs on the worker thread once no more items will be processed */
  void set_on_exit(std::function<void()> on_exit) {
    on_exit_ = std::move(on_exit);
  }

  bool start() {
    if (thread_.joinable()) {
      BOOST_LOG_SEV(log_, boost::log::trivial::warning)
          << name_ << ":: already started";
      return false;
    }
    finished_ = done_.get_future();
    running_ = true;
    thread_ = std::thread([self = this->shared_from_this()] { self->loop(); });
    return true;
  }

  /* observed between items, the item in flight always completes */
  void request_stop() { stop_requested_ = true; }

  /* joins the thread, or abandons it if it misses the deadline */
  bool wait_until(std::chrono::steady_clock::time_point deadline) {
    if (!thread_.joinable()) {
      return true;
    }
    if (finished_.wait_until(deadline) == std::future_status::ready) {
      thread_.join();
      return true;
    }
    BOOST_LOG_SEV(log_, boost::log::trivial::error)
        << name_ << ":: did not stop in time, abandoning";
    thread_.detach();
    return false;
  }

  bool is_running() const { return running_; }
  bool is_faulted() const { return faulted_; }
  uint64_t get_processed() const { return processed_; }
  uint64_t get_failed() const { return failed_; }
  const std::string &get_name() const { return name_; }

protected:
  virtual StageResult process(Input &item, const Sink &sink) = 0;

  Logger log_;

private:
  void loop() {
    BOOST_LOG_SEV(log_, boost::log::trivial::debug) << name_ << ":: loop start";
    while (!stop_requested_) {
      auto item = input_->pop();
      if (!item) {
        break; // end of stream
      }

      auto res = StageResult::ok();
      try {
        res = process(*item, sink_);
      } catch (const std::exception &e) {
        res = StageResult::transient(e.what());
      }

      if (res.is_ok()) {
        processed_++;
      } else if (res.is_fatal()) {
        BOOST_LOG_SEV(log_, boost::log::trivial::fatal)
            << name_ << ":: fatal error: " << res.get_message();
        faulted_ = true;
        /* release producers blocked on this stage */
        input_->cancel();
        break;
      } else {
        failed_++;
        BOOST_LOG_SEV(log_, boost::log::trivial::warning)
            << name_ << ":: item skipped: " << res.get_message();
      }
    }

    if (on_exit_) {
      on_exit_();
    }
    running_ = false;
    BOOST_LOG_SEV(log_, boost::log::trivial::debug) << name_ << ":: loop end";
    done_.set_value();
  }

  const std::string name_;
  std::shared_ptr<InputQueue> input_;
  Sink sink_;
  std::function<void()> on_exit_;
  std::thread thread_;
  std::promise<void> done_;
  std::future<void> finished_;
  std::atomic_bool running_{false};
  std::atomic_bool stop_requested_{false};
  std::atomic_bool faulted_{false};
  std::atomic<uint64_t> processed_{0};
  std::atomic<uint64_t> failed_{0};
};

#endif
