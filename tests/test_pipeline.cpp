//
//  test_pipeline.cpp
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
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "config.hpp"
#include "pipeline.hpp"

using namespace std::chrono_literals;

namespace {

constexpr float kChunkDuration = 0.1f;
constexpr size_t kChunkSamples = 1600;

/* plays a list of sample blocks from its own thread, then stays idle */
class FakeAudioSource : public AudioSource {
public:
  ~FakeAudioSource() override { stop(); }

  std::vector<AudioDevice> list_devices() override {
    return {AudioDevice{0, "default", 1, kSampleRate},
            AudioDevice{1, "fake:usb", 2, 48000}};
  }

  bool start(int device_index, SamplesCallback callback) override {
    if (fail_start || device_index > 1) {
      return false;
    }
    stop_ = false;
    thread_ = std::thread([this, callback] {
      for (const auto &block : blocks) {
        if (stop_ || !callback(block.data(), block.size())) {
          break;
        }
      }
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stop_.load(); });
    });
    return true;
  }

  void stop() override {
    auto hang = stop_delay_ms.exchange(0);
    if (hang > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(hang));
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stop_ = true;
      cv_.notify_all();
    }
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  void add_chunks(size_t count, size_t extra_samples = 0) {
    for (size_t i = 0; i < count; i++) {
      blocks.emplace_back(kChunkSamples, 0.1f);
    }
    if (extra_samples) {
      blocks.emplace_back(extra_samples, 0.1f);
    }
  }

  std::vector<std::vector<float>> blocks;
  bool fail_start{false};
  /* the next stop() hangs this long */
  std::atomic<int> stop_delay_ms{0};

private:
  std::thread thread_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic_bool stop_{false};
};

/* one scripted utterance per chunk, growing partials then the final text */
class ScriptedRecognizer : public Recognizer {
public:
  explicit ScriptedRecognizer(std::vector<std::string> script)
      : script_(std::move(script)) {}

  bool load_model() override {
    load_calls++;
    return load_ok;
  }
  void warm_up() override { warm_ups++; }

  StageResult transcribe(const AudioChunk &chunk, const Emit &emit) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      chunks.push_back(chunk.sequence);
      if (chunk.is_final) {
        final_chunk_samples = chunk.samples.size();
      }
    }
    auto now_active = ++active;
    auto seen = max_active.load();
    while (now_active > seen &&
           !max_active.compare_exchange_weak(seen, now_active)) {
    }
    struct Leave {
      std::atomic<int> &active;
      ~Leave() { active--; }
    } leave{active};

    if (delay_ms > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms.load()));
    }
    auto index = next_++;
    if (throw_on.count(index)) {
      throw std::runtime_error("decoder error");
    }
    if (fatal_on.count(index)) {
      return StageResult::fatal("device lost");
    }
    if (index >= script_.size()) {
      return StageResult::ok();
    }
    for (int k = 0; k < partials_per_chunk; k++) {
      emit("p" + std::to_string(index) + "-" + std::to_string(k), false);
    }
    emit(script_[index], true);
    return StageResult::ok();
  }

  std::vector<uint64_t> get_chunks() {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks;
  }

  bool load_ok{true};
  std::atomic<int> load_calls{0};
  std::atomic<int> warm_ups{0};
  std::atomic<int> delay_ms{0};
  std::atomic<int> active{0};
  std::atomic<int> max_active{0};
  int partials_per_chunk{2};
  std::set<size_t> throw_on;
  std::set<size_t> fatal_on;
  std::atomic<size_t> final_chunk_samples{0};

private:
  std::vector<std::string> script_;
  std::atomic<size_t> next_{0};
  std::mutex mutex_;
  std::vector<uint64_t> chunks;
};

/* looks the text up in a dictionary and records the context it was given */
class DictionaryTranslator : public Translator {
public:
  explicit DictionaryTranslator(std::map<std::string, std::string> dictionary)
      : dictionary_(std::move(dictionary)) {}

  bool load_model() override {
    load_calls++;
    return load_ok;
  }
  void warm_up() override {}

  StageResult translate(const std::string &text, const ContextSnapshot &context,
                        std::string &out) override {
    if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      contexts.push_back(context);
    }
    if (text == fail_on) {
      return StageResult::transient("model busy");
    }
    auto it = dictionary_.find(text);
    out = it != dictionary_.end() ? it->second : "[" + text + "]";
    return StageResult::ok();
  }

  std::vector<ContextSnapshot> get_contexts() {
    std::lock_guard<std::mutex> lock(mutex_);
    return contexts;
  }

  bool load_ok{true};
  std::atomic<int> load_calls{0};
  std::chrono::milliseconds delay{0};
  std::string fail_on;

private:
  std::map<std::string, std::string> dictionary_;
  std::mutex mutex_;
  std::vector<ContextSnapshot> contexts;
};

struct Delivered {
  std::string original;
  std::string translation;
  std::string context;
};

} // namespace

class PipelineTest : public ::testing::Test {
protected:
  void SetUp() override {
    config.set_log_severity(4);
    config.set_chunk_duration(kChunkDuration);
    config.set_shutdown_grace_ms(3000);
    log_init(config);
    audio = std::make_shared<FakeAudioSource>();
  }

  void TearDown() override {
    if (pipeline) {
      pipeline->stop();
    }
  }

  void build(std::vector<std::string> script,
             std::map<std::string, std::string> dictionary = {}) {
    recognizer = std::make_shared<ScriptedRecognizer>(std::move(script));
    translator = std::make_shared<DictionaryTranslator>(std::move(dictionary));
    context = std::make_shared<ContextManager>(5, 3, nullptr, log);
    pipeline =
        Pipeline::create(config, audio, recognizer, translator, context, log);
    pipeline->set_callbacks(
        [this](const std::string &text) {
          std::lock_guard<std::mutex> lock(mutex);
          partials.push_back(text);
          callback_threads.insert(std::this_thread::get_id());
        },
        [this](const std::string &original, const std::string &translation,
               const std::string &ctx) {
          std::lock_guard<std::mutex> lock(mutex);
          delivered.push_back(Delivered{original, translation, ctx});
          callback_threads.insert(std::this_thread::get_id());
        });
  }

  bool wait_for_translations(size_t count,
                             std::chrono::milliseconds timeout = 3s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      {
        std::lock_guard<std::mutex> lock(mutex);
        if (delivered.size() >= count) {
          return true;
        }
      }
      std::this_thread::sleep_for(5ms);
    }
    return false;
  }

  Config config;
  Logger log;
  std::shared_ptr<FakeAudioSource> audio;
  std::shared_ptr<ScriptedRecognizer> recognizer;
  std::shared_ptr<DictionaryTranslator> translator;
  std::shared_ptr<ContextManager> context;
  std::shared_ptr<Pipeline> pipeline;

  std::mutex mutex;
  std::vector<std::string> partials;
  std::vector<Delivered> delivered;
  std::set<std::thread::id> callback_threads;
};

// Test one utterance travels from audio to the translation callback
TEST_F(PipelineTest, TranslatesUtteranceWithPriorContext) {
  audio->add_chunks(2);
  build({"こんにちは", "元気ですか"},
        {{"こんにちは", "你好"}, {"元気ですか", "你好嗎"}});

  ASSERT_TRUE(pipeline->start(0));
  EXPECT_EQ(pipeline->get_state(), Pipeline::State::running);
  ASSERT_TRUE(wait_for_translations(2));
  pipeline->stop();

  ASSERT_EQ(delivered.size(), 2u);
  EXPECT_EQ(delivered[0].original, "こんにちは");
  EXPECT_EQ(delivered[0].translation, "你好");
  EXPECT_EQ(delivered[0].context, "");
  EXPECT_EQ(delivered[1].original, "元気ですか");
  EXPECT_EQ(delivered[1].translation, "你好嗎");
  // the context holds the earlier turn only
  EXPECT_EQ(delivered[1].context, "Recent:\n- こんにちは => 你好");

  auto contexts = translator->get_contexts();
  ASSERT_EQ(contexts.size(), 2u);
  EXPECT_TRUE(contexts[0].window.empty());
  ASSERT_EQ(contexts[1].window.size(), 1u);

  auto snap = context->snapshot();
  ASSERT_EQ(snap.window.size(), 2u);
  EXPECT_EQ(snap.window.back().original, "元気ですか");
  EXPECT_EQ(snap.window.back().translation, "你好嗎");

  // callbacks come from the pipeline, not from the test thread
  EXPECT_EQ(callback_threads.size(), 1u);
  EXPECT_EQ(callback_threads.count(std::this_thread::get_id()), 0u);
}

// Test stop flushes the remainder and drains it through every stage
TEST_F(PipelineTest, StopDrainsFlushedRemainder) {
  audio->add_chunks(1, 800);
  build({"一", "二"});

  ASSERT_TRUE(pipeline->start(0));
  ASSERT_TRUE(wait_for_translations(1));
  pipeline->stop();

  EXPECT_EQ(pipeline->get_state(), Pipeline::State::stopped);
  EXPECT_FALSE(pipeline->shutdown_timed_out());
  EXPECT_EQ(recognizer->get_chunks(), (std::vector<uint64_t>{0, 1}));
  EXPECT_EQ(recognizer->final_chunk_samples.load(), 800u);
  ASSERT_EQ(delivered.size(), 2u);
  EXPECT_EQ(delivered[1].translation, "[二]");

  auto stats = pipeline->get_stats();
  EXPECT_EQ(stats.chunks, 2u);
  EXPECT_EQ(stats.finals, 2u);
  EXPECT_EQ(stats.translations, 2u);
  EXPECT_EQ(stats.dropped_finals, 0u);
}

// Test stop is a no-op when idle and when already stopped
TEST_F(PipelineTest, StopIsIdempotent) {
  build({});
  pipeline->stop();
  EXPECT_EQ(pipeline->get_state(), Pipeline::State::idle);

  ASSERT_TRUE(pipeline->start(0));
  EXPECT_FALSE(pipeline->start(0));
  pipeline->stop();
  pipeline->stop();
  EXPECT_EQ(pipeline->get_state(), Pipeline::State::stopped);
}

// Test a failing model load leaves nothing running
TEST_F(PipelineTest, LoadFailureEndsInError) {
  build({"あ"});
  recognizer->load_ok = false;

  EXPECT_FALSE(pipeline->start(0));
  EXPECT_EQ(pipeline->get_state(), Pipeline::State::error);
  EXPECT_FALSE(pipeline->start(0));
  EXPECT_EQ(pipeline->get_state(), Pipeline::State::error);
  EXPECT_EQ(recognizer->load_calls.load(), 2);
  EXPECT_FALSE(pipeline->is_faulted());
  EXPECT_FALSE(pipeline->shutdown_timed_out());

  // stop from error is a no-op
  pipeline->stop();
  EXPECT_EQ(pipeline->get_state(), Pipeline::State::error);

  // start is accepted again from error
  recognizer->load_ok = true;
  audio->add_chunks(1);
  ASSERT_TRUE(pipeline->start(0));
  ASSERT_TRUE(wait_for_translations(1));
  pipeline->stop();
  EXPECT_EQ(delivered.size(), 1u);
}

// Test the translation engine is loaded before the recognition engine
TEST_F(PipelineTest, TranslatorLoadFailureSkipsRecognizer) {
  build({"あ"});
  translator->load_ok = false;

  EXPECT_FALSE(pipeline->start(0));
  EXPECT_EQ(pipeline->get_state(), Pipeline::State::error);
  EXPECT_EQ(translator->load_calls.load(), 1);
  EXPECT_EQ(recognizer->load_calls.load(), 0);
}

TEST_F(PipelineTest, AudioStartFailureEndsInError) {
  build({"あ"});
  audio->fail_start = true;

  EXPECT_FALSE(pipeline->start(0));
  EXPECT_EQ(pipeline->get_state(), Pipeline::State::error);
  EXPECT_EQ(recognizer->warm_ups.load(), 1);
}

// Test failed items are skipped without stopping the pipeline
TEST_F(PipelineTest, TransientFailuresAreSkipped) {
  audio->add_chunks(4);
  build({"a", "b", "c", "d"});
  translator->fail_on = "b";
  recognizer->throw_on = {2};

  ASSERT_TRUE(pipeline->start(0));
  ASSERT_TRUE(wait_for_translations(2));
  pipeline->stop();

  ASSERT_EQ(delivered.size(), 2u);
  EXPECT_EQ(delivered[0].original, "a");
  EXPECT_EQ(delivered[1].original, "d");
  EXPECT_EQ(delivered[1].context, "Recent:\n- a => [a]");
  EXPECT_FALSE(pipeline->is_faulted());
  EXPECT_EQ(pipeline->get_stats().failed_items, 2u);
}

// Test a fatal engine error faults the pipeline and stop still completes
TEST_F(PipelineTest, FatalErrorFaultsPipeline) {
  audio->add_chunks(3);
  build({"a", "b", "c"});
  recognizer->fatal_on = {1};

  ASSERT_TRUE(pipeline->start(0));
  auto deadline = std::chrono::steady_clock::now() + 3s;
  while (!pipeline->is_faulted() &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  EXPECT_TRUE(pipeline->is_faulted());

  pipeline->stop();
  EXPECT_EQ(pipeline->get_state(), Pipeline::State::stopped);
  EXPECT_FALSE(pipeline->shutdown_timed_out());
  ASSERT_EQ(delivered.size(), 1u);
  EXPECT_EQ(delivered[0].original, "a");
}

// Test a slow translator never costs a final result, partials may be dropped
TEST_F(PipelineTest, OverloadNeverDropsFinals) {
  const size_t count = 12;
  audio->add_chunks(count);
  std::vector<std::string> script;
  for (size_t i = 0; i < count; i++) {
    script.push_back("u" + std::to_string(i));
  }
  build(script);
  recognizer->partials_per_chunk = 20;
  translator->delay = 30ms;

  ASSERT_TRUE(pipeline->start(0));
  ASSERT_TRUE(wait_for_translations(count, 5s));
  pipeline->stop();

  ASSERT_EQ(delivered.size(), count);
  for (size_t i = 0; i < count; i++) {
    EXPECT_EQ(delivered[i].original, "u" + std::to_string(i));
  }

  auto stats = pipeline->get_stats();
  EXPECT_EQ(stats.dropped_finals, 0u);
  EXPECT_EQ(stats.finals, count);
  EXPECT_EQ(stats.partials, count * 20);
  EXPECT_EQ(partials.size() + stats.dropped_partials, count * 20);

  // whatever partials survived arrive in the order they were produced
  std::vector<std::pair<int, int>> order;
  for (const auto &p : partials) {
    auto dash = p.find('-');
    order.emplace_back(std::stoi(p.substr(1, dash - 1)),
                       std::stoi(p.substr(dash + 1)));
  }
  EXPECT_TRUE(std::is_sorted(order.begin(), order.end()));
}

// Test a stuck engine cannot hold stop past the grace period
TEST_F(PipelineTest, ShutdownTimeoutAbandonsStuckWorker) {
  config.set_shutdown_grace_ms(200);
  audio->add_chunks(3);
  build({"a", "b", "c"});
  recognizer->delay_ms = 1500;

  ASSERT_TRUE(pipeline->start(0));
  std::this_thread::sleep_for(50ms);

  auto begin = std::chrono::steady_clock::now();
  pipeline->stop();
  auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_LT(elapsed, 1200ms);
  EXPECT_TRUE(pipeline->shutdown_timed_out());
  EXPECT_EQ(pipeline->get_state(), Pipeline::State::stopped);
  EXPECT_GT(pipeline->get_stats().dropped_finals, 0u);

  // let the abandoned thread finish on the objects it still owns
  std::this_thread::sleep_for(1600ms);
}

// Test a stopped pipeline starts again with fresh sequence numbers
TEST_F(PipelineTest, RestartAfterStop) {
  audio->add_chunks(1);
  build({"a", "b"});

  ASSERT_TRUE(pipeline->start(0));
  ASSERT_TRUE(wait_for_translations(1));
  pipeline->stop();

  ASSERT_TRUE(pipeline->start(0));
  ASSERT_TRUE(wait_for_translations(2));
  pipeline->stop();

  EXPECT_EQ(recognizer->get_chunks(), (std::vector<uint64_t>{0, 0}));
  EXPECT_EQ(pipeline->get_stats().chunks, 1u);
  EXPECT_EQ(delivered[1].context, "Recent:\n- a => [a]");
}

TEST_F(PipelineTest, ListsDevicesAndRejectsMissingCollaborators) {
  build({});
  auto devices = pipeline->list_devices();
  ASSERT_EQ(devices.size(), 2u);
  EXPECT_EQ(devices[0].name, "default");

  EXPECT_THROW(Pipeline::create(config, nullptr, recognizer, translator,
                                context, log),
               std::invalid_argument);
}

// Test no restart while an abandoned worker is still inside its engine
TEST_F(PipelineTest, RestartWaitsForAbandonedWorker) {
  config.set_shutdown_grace_ms(100);
  audio->add_chunks(2);
  build({"a", "b", "c", "d"});
  recognizer->delay_ms = 600;

  ASSERT_TRUE(pipeline->start(0));
  std::this_thread::sleep_for(50ms);
  pipeline->stop();
  ASSERT_TRUE(pipeline->shutdown_timed_out());

  EXPECT_FALSE(pipeline->start(0));
  EXPECT_EQ(pipeline->get_state(), Pipeline::State::stopped);

  bool restarted{false};
  auto deadline = std::chrono::steady_clock::now() + 3s;
  while (!restarted && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(20ms);
    restarted = pipeline->start(0);
  }
  ASSERT_TRUE(restarted);
  recognizer->delay_ms = 0;
  ASSERT_TRUE(wait_for_translations(1));
  pipeline->stop();

  EXPECT_LE(recognizer->max_active.load(), 1);
}

// Test a hanging audio stop is bounded by the grace period
TEST_F(PipelineTest, HangingAudioStopIsAbandoned) {
  config.set_shutdown_grace_ms(100);
  build({});
  audio->stop_delay_ms = 800;

  ASSERT_TRUE(pipeline->start(0));
  auto begin = std::chrono::steady_clock::now();
  pipeline->stop();
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 600ms);
  EXPECT_TRUE(pipeline->shutdown_timed_out());
  EXPECT_EQ(pipeline->get_state(), Pipeline::State::stopped);

  // the audio source is still stopping
  EXPECT_FALSE(pipeline->start(0));

  bool restarted{false};
  auto deadline = std::chrono::steady_clock::now() + 3s;
  while (!restarted && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(20ms);
    restarted = pipeline->start(0);
  }
  EXPECT_TRUE(restarted);
}
