//
//  test_chunker.cpp
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
#include <memory>
#include <stdexcept>
#include <vector>

#include "chunker.hpp"
#include "config.hpp"

class ChunkerTest : public ::testing::Test {
protected:
  void SetUp() override {
    Config config;
    config.set_log_severity(4);
    log_init(config);
  }

  std::unique_ptr<Chunker> make_chunker(float duration) {
    auto chunker = std::make_unique<Chunker>(duration, kSampleRate, log);
    chunker->set_callback([this](AudioChunk &&chunk) {
      chunks.push_back(std::move(chunk));
      return true;
    });
    return chunker;
  }

  Logger log;
  std::vector<AudioChunk> chunks;
};

// Test that full chunks have exactly the nominal sample count
TEST_F(ChunkerTest, EmitsFixedSizeChunks) {
  auto chunker = make_chunker(2.0f);
  EXPECT_EQ(chunker->get_chunk_samples(), 32000u);

  std::vector<float> samples(32000 * 2 + 100, 0.5f);
  ASSERT_TRUE(chunker->push(samples));

  ASSERT_EQ(chunks.size(), 2u);
  for (const auto &chunk : chunks) {
    EXPECT_EQ(chunk.samples.size(), 32000u);
    EXPECT_FLOAT_EQ(chunk.duration, 2.0f);
    EXPECT_FALSE(chunk.is_final);
  }
  EXPECT_EQ(chunker->get_pending_samples(), 100u);
}

// Test accumulation across many small pushes
TEST_F(ChunkerTest, AccumulatesSmallBuffers) {
  auto chunker = make_chunker(0.1f);
  std::vector<float> block(160, 0.0f);
  for (int i = 0; i < 25; i++) {
    ASSERT_TRUE(chunker->push(block));
  }
  // 25 * 160 = 4000 samples, 1600 per chunk
  EXPECT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunker->get_pending_samples(), 800u);
}

// Test that flush emits the remainder as the final chunk
TEST_F(ChunkerTest, FlushEmitsShortFinalChunk) {
  auto chunker = make_chunker(0.1f);
  std::vector<float> samples(1600 + 400, 0.25f);
  ASSERT_TRUE(chunker->push(samples));
  ASSERT_TRUE(chunker->flush());

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_FALSE(chunks[0].is_final);
  EXPECT_TRUE(chunks[1].is_final);
  EXPECT_EQ(chunks[1].samples.size(), 400u);
  EXPECT_FLOAT_EQ(chunks[1].duration, 400.0f / kSampleRate);
  EXPECT_EQ(chunker->get_pending_samples(), 0u);
}

// Test that an empty remainder produces no chunk
TEST_F(ChunkerTest, FlushWithEmptyRemainderEmitsNothing) {
  auto chunker = make_chunker(0.1f);
  std::vector<float> samples(1600, 0.25f);
  ASSERT_TRUE(chunker->push(samples));
  ASSERT_TRUE(chunker->flush());
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_FALSE(chunks[0].is_final);
}

// Test flush is applied once and pushes after it are rejected
TEST_F(ChunkerTest, FlushOnlyOnce) {
  auto chunker = make_chunker(0.1f);
  std::vector<float> samples(100, 0.25f);
  ASSERT_TRUE(chunker->push(samples));
  EXPECT_TRUE(chunker->flush());
  EXPECT_TRUE(chunker->flush());
  EXPECT_EQ(chunks.size(), 1u);

  EXPECT_FALSE(chunker->push(samples));
  EXPECT_EQ(chunks.size(), 1u);
}

// Test sequence numbers are gap free from zero and restart after reset
TEST_F(ChunkerTest, SequenceIsGapFree) {
  auto chunker = make_chunker(0.01f);
  std::vector<float> samples(160 * 10 + 7, 0.0f);
  ASSERT_TRUE(chunker->push(samples));
  ASSERT_TRUE(chunker->flush());

  ASSERT_EQ(chunks.size(), 11u);
  for (size_t i = 0; i < chunks.size(); i++) {
    EXPECT_EQ(chunks[i].sequence, i);
  }
  EXPECT_EQ(chunker->get_chunks_emitted(), 11u);

  chunker->reset();
  chunks.clear();
  ASSERT_TRUE(chunker->push(std::vector<float>(160, 0.0f)));
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].sequence, 0u);
}

// Test a rejecting consumer is reported to the producer
TEST_F(ChunkerTest, RejectedChunkFailsPush) {
  Chunker chunker(0.01f, kSampleRate, log);
  chunker.set_callback([](AudioChunk &&) { return false; });
  EXPECT_FALSE(chunker.push(std::vector<float>(160, 0.0f)));
}

TEST_F(ChunkerTest, InvalidDurationThrows) {
  EXPECT_THROW(Chunker(0.0f, kSampleRate, log), std::invalid_argument);
  EXPECT_THROW(Chunker(-1.0f, kSampleRate, log), std::invalid_argument);
  EXPECT_THROW(Chunker(1e-6f, kSampleRate, log), std::invalid_argument);
}
