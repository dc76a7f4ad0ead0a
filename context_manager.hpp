//
//  context_manager.hpp
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

#ifndef _CONTEXT_MANAGER_HPP_
#define _CONTEXT_MANAGER_HPP_

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "log.hpp"

class Translator;

struct ContextEntry {
  std::string original;
  std::string translation;
  uint64_t sequence{0};
};

/* value copy of the context at one point in time */
struct ContextSnapshot {
  std::string summary;
  std::vector<ContextEntry> window; // oldest first

  bool empty() const { return summary.empty() && window.empty(); }
  std::string render() const;
};

/* must return the same summary for the same window */
using SummaryStrategy =
    std::function<std::string(const std::vector<ContextEntry> &window)>;

constexpr size_t kMaxSummaryChars = 200;

SummaryStrategy make_recent_summary(size_t max_chars = kMaxSummaryChars);
SummaryStrategy make_llm_summary(std::shared_ptr<Translator> translator,
                                 const Logger &log,
                                 size_t max_chars = kMaxSummaryChars);

/*
 * Rolling window of the last translated turns plus a summary that is
 * regenerated every update_interval recorded turns.
 */
class ContextManager {
public:
  ContextManager(size_t window_size, size_t update_interval,
                 SummaryStrategy strategy, const Logger &log);
  ContextManager(const ContextManager &) = delete;

  ContextSnapshot snapshot() const;
  void record_turn(ContextEntry entry);
  void clear();

  size_t size() const;
  uint64_t turns() const;
  size_t get_window_size() const { return window_size_; }
  size_t get_update_interval() const { return update_interval_; }

private:
  const size_t window_size_;
  const size_t update_interval_;
  SummaryStrategy strategy_;
  Logger log_;

  mutable std::mutex mutex_;
  std::deque<ContextEntry> window_;
  std::string summary_;
  uint64_t turns_{0};
};

#endif
