//
//  chunker.hpp
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

#ifndef _CHUNKER_HPP_
#define _CHUNKER_HPP_

#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

#include "log.hpp"

constexpr uint32_t kSampleRate = 16000;

struct AudioChunk {
  std::vector<float> samples; // mono
  uint64_t sequence{0};
  float duration{0};
  bool is_final{false}; // only the flush chunk emitted at stop
};

/*
 * Slices the capture stream into fixed duration chunks.
 * The callback runs on the pushing thread and may block, it returns false
 * once the downstream queue no longer accepts chunks.
 */
class Chunker {
public:
  using ChunkCallback = std::function<bool(AudioChunk &&chunk)>;

  Chunker(float chunk_duration, uint32_t sample_rate, const Logger &log);
  Chunker(const Chunker &) = delete;

  void set_callback(ChunkCallback callback);

  bool push(const float *samples, size_t count);
  bool push(const std::vector<float> &samples) {
    return push(samples.data(), samples.size());
  }
  bool flush();
  void reset();

  size_t get_chunk_samples() const { return chunk_samples_; }
  uint64_t get_chunks_emitted() const;
  size_t get_pending_samples() const;

private:
  bool emit(bool is_final);

  const uint32_t sample_rate_;
  const size_t chunk_samples_;
  Logger log_;
  mutable std::mutex mutex_;
  ChunkCallback callback_;
  std::vector<float> buffer_;
  uint64_t sequence_{0};
  bool flushed_{false};
};

#endif
