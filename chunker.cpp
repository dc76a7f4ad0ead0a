//
//  chunker.cpp
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

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "chunker.hpp"

static size_t to_samples(float chunk_duration, uint32_t sample_rate) {
  if (!(chunk_duration > 0) || sample_rate == 0) {
    throw std::invalid_argument("chunker:: chunk duration must be positive");
  }
  auto samples = std::lround(chunk_duration * sample_rate);
  if (samples < 1) {
    throw std::invalid_argument("chunker:: chunk duration " +
                                std::to_string(chunk_duration) +
                                " is shorter than one sample");
  }
  return static_cast<size_t>(samples);
}

Chunker::Chunker(float chunk_duration, uint32_t sample_rate, const Logger &log)
    : sample_rate_(sample_rate),
      chunk_samples_(to_samples(chunk_duration, sample_rate)), log_(log) {
  buffer_.reserve(chunk_samples_);
  BOOST_LOG_SEV(log_, boost::log::trivial::debug)
      << "chunker:: chunk_samples " << chunk_samples_;
}

void Chunker::set_callback(ChunkCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callback_ = std::move(callback);
}

bool Chunker::push(const float *samples, size_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (flushed_) {
    BOOST_LOG_SEV(log_, boost::log::trivial::warning)
        << "chunker:: push after flush, dropping " << count << " samples";
    return false;
  }

  while (count > 0) {
    auto take = std::min(count, chunk_samples_ - buffer_.size());
    buffer_.insert(buffer_.end(), samples, samples + take);
    samples += take;
    count -= take;

    if (buffer_.size() == chunk_samples_ && !emit(false)) {
      return false;
    }
  }
  return true;
}

bool Chunker::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (flushed_) {
    BOOST_LOG_SEV(log_, boost::log::trivial::warning)
        << "chunker:: already flushed";
    return true;
  }
  flushed_ = true;

  if (buffer_.empty()) {
    BOOST_LOG_SEV(log_, boost::log::trivial::debug)
        << "chunker:: nothing to flush";
    return true;
  }
  return emit(true);
}

void Chunker::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  buffer_.clear();
  sequence_ = 0;
  flushed_ = false;
}

uint64_t Chunker::get_chunks_emitted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sequence_;
}

size_t Chunker::get_pending_samples() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buffer_.size();
}

bool Chunker::emit(bool is_final) {
  AudioChunk chunk;
  chunk.samples.swap(buffer_);
  chunk.sequence = sequence_++;
  chunk.duration = static_cast<float>(chunk.samples.size()) / sample_rate_;
  chunk.is_final = is_final;
  buffer_.reserve(chunk_samples_);

  BOOST_LOG_SEV(log_, boost::log::trivial::trace)
      << "chunker:: chunk " << chunk.sequence << " samples "
      << chunk.samples.size() << (is_final ? " (final)" : "");
  if (!callback_) {
    BOOST_LOG_SEV(log_, boost::log::trivial::warning)
        << "chunker:: no consumer, chunk " << chunk.sequence << " discarded";
    return false;
  }
  return callback_(std::move(chunk));
}
