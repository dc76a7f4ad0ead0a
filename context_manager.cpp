//
//  context_manager.cpp
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

#include <boost/algorithm/string.hpp>
#include <sstream>
#include <stdexcept>

#include "context_manager.hpp"
#include "translator.hpp"
#include "utils.hpp"

std::string ContextSnapshot::render() const {
  std::ostringstream out;
  if (!summary.empty()) {
    out << "Context: " << summary << '\n';
  }
  if (!window.empty()) {
    out << "Recent:\n";
    for (const auto &entry : window) {
      out << "- " << entry.original;
      if (!entry.translation.empty()) {
        out << " => " << entry.translation;
      }
      out << '\n';
    }
  }
  return boost::algorithm::trim_right_copy(out.str());
}

SummaryStrategy make_recent_summary(size_t max_chars) {
  return [max_chars](const std::vector<ContextEntry> &window) {
    if (window.size() < 2) {
      return std::string();
    }

    constexpr size_t recent = 3;
    constexpr size_t excerpt_chars = 30;
    std::string summary;
    auto first = window.size() > recent ? window.end() - recent : window.begin();
    for (auto it = first; it != window.end(); ++it) {
      if (!summary.empty()) {
        summary += " → ";
      }
      summary += utf8_truncate(it->original, excerpt_chars) + "...";
    }

    if (utf8_length(summary) > max_chars) {
      summary = utf8_truncate(summary, max_chars) + "...";
    }
    return summary;
  };
}

SummaryStrategy make_llm_summary(std::shared_ptr<Translator> translator,
                                 const Logger &log, size_t max_chars) {
  return [translator, log = Logger(log), max_chars](
             const std::vector<ContextEntry> &window) mutable {
    if (window.size() < 2) {
      return std::string();
    }

    std::ostringstream prompt;
    prompt << "Summarize the topic and situation of the following "
              "conversation in one or two sentences, at most "
           << max_chars << " characters:\n\n";
    for (size_t i = 0; i < window.size(); i++) {
      prompt << (i + 1) << ". " << window[i].original << '\n';
    }
    prompt << "\nSummary:";

    std::string summary;
    auto res = translator->summarize(prompt.str(), summary);
    if (!res.is_ok()) {
      BOOST_LOG_SEV(log, boost::log::trivial::error)
          << "context:: summary generation failed: " << res.get_message();
      return std::string();
    }
    return utf8_truncate(summary, max_chars);
  };
}

ContextManager::ContextManager(size_t window_size, size_t update_interval,
                               SummaryStrategy strategy, const Logger &log)
    : window_size_(window_size), update_interval_(update_interval),
      strategy_(std::move(strategy)), log_(log) {
  if (window_size_ == 0 || update_interval_ == 0) {
    throw std::invalid_argument(
        "context:: window size and update interval must be positive");
  }
  if (!strategy_) {
    strategy_ = make_recent_summary();
  }
  BOOST_LOG_SEV(log_, boost::log::trivial::info)
      << "context:: window size " << window_size_ << " update interval "
      << update_interval_;
}

ContextSnapshot ContextManager::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  ContextSnapshot snapshot;
  snapshot.summary = summary_;
  snapshot.window.assign(window_.begin(), window_.end());
  return snapshot;
}

void ContextManager::record_turn(ContextEntry entry) {
  boost::algorithm::trim(entry.original);
  boost::algorithm::trim(entry.translation);
  if (entry.original.empty()) {
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  window_.push_back(std::move(entry));
  while (window_.size() > window_size_) {
    window_.pop_front();
  }
  turns_++;

  BOOST_LOG_SEV(log_, boost::log::trivial::debug)
      << "context:: turn " << turns_ << " recorded, " << window_.size()
      << " in window";

  if (turns_ % update_interval_ == 0) {
    /* the strategy runs under the lock, readers see the old or new pair */
    auto summary =
        strategy_(std::vector<ContextEntry>(window_.begin(), window_.end()));
    if (!summary.empty()) {
      summary_ = std::move(summary);
      BOOST_LOG_SEV(log_, boost::log::trivial::info)
          << "context:: summary updated: " << summary_;
    }
  }
}

void ContextManager::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  window_.clear();
  summary_.clear();
  turns_ = 0;
  BOOST_LOG_SEV(log_, boost::log::trivial::info) << "context:: cleared";
}

size_t ContextManager::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return window_.size();
}

uint64_t ContextManager::turns() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return turns_;
}
