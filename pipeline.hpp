//
//  pipeline.hpp
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

#ifndef _PIPELINE_HPP_
#define _PIPELINE_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "audio_source.hpp"
#include "bounded_queue.hpp"
#include "chunker.hpp"
#include "config.hpp"
#include "context_manager.hpp"
#include "display_channel.hpp"
#include "log.hpp"
#include "recognition_stage.hpp"
#include "recognizer.hpp"
#include "translation_stage.hpp"
#include "translator.hpp"

class DisplayStage;

/*
 * Audio source -> chunker -> recognition -> translation -> display.
 * Owns the queues and the stage threads. Callbacks are invoked from the
 * pipeline display thread, never from the caller's thread.
 */
class Pipeline {
public:
  enum class State { idle, starting, running, stopping, stopped, error };

  using PartialCallback = std::function<void(const std::string &text)>;
  using TranslationCallback =
      std::function<void(const std::string &original,
                          const std::string &translation,
                          const std::string &context)>;

  struct Stats {
    uint64_t chunks{0};
    uint64_t partials{0};
    uint64_t finals{0};
    uint64_t translations{0};
    uint64_t failed_items{0};
    uint64_t dropped_partials{0};
    uint64_t dropped_finals{0};
  };

  static std::shared_ptr<Pipeline>
  create(const Config &config, std::shared_ptr<AudioSource> audio,
         std::shared_ptr<Recognizer> recognizer,
         std::shared_ptr<Translator> translator,
         std::shared_ptr<ContextManager> context, const Logger &log);
  Pipeline() = delete;
  Pipeline(const Pipeline &) = delete;
  ~Pipeline();

  /* takes effect at the next start() */
  void set_callbacks(PartialCallback on_partial,
                     TranslationCallback on_translation);

  bool start(int device_index);
  void stop();

  std::vector<AudioDevice> list_devices();

  State get_state() const { return state_; }
  bool shutdown_timed_out() const { return timed_out_; }
  bool is_faulted() const;
  Stats get_stats() const;

  static const char *to_string(State state);

protected:
  Pipeline(const Config &config, std::shared_ptr<AudioSource> audio,
           std::shared_ptr<Recognizer> recognizer,
           std::shared_ptr<Translator> translator,
           std::shared_ptr<ContextManager> context, const Logger &log);

private:
  bool start_stages(int device_index);
  bool fail(const std::string &reason);
  void cancel_all();
  bool join_all(std::chrono::steady_clock::time_point deadline);
  size_t prune_abandoned();
  void set_state(State state);

  const Config &config_;
  std::shared_ptr<AudioSource> audio_;
  std::shared_ptr<Recognizer> recognizer_;
  std::shared_ptr<Translator> translator_;
  std::shared_ptr<ContextManager> context_;
  Logger log_;

  std::mutex control_mutex_;
  std::atomic<State> state_{State::idle};
  std::atomic_bool timed_out_{false};
  PartialCallback on_partial_;
  TranslationCallback on_translation_;
  /* one busy check per thread abandoned at a shutdown deadline */
  std::vector<std::function<bool()>> abandoned_;

  std::shared_ptr<BoundedQueue<AudioChunk>> audio_queue_;
  std::shared_ptr<BoundedQueue<RecognitionResult>> text_queue_;
  std::shared_ptr<BoundedQueue<DisplayEvent>> display_queue_;
  std::shared_ptr<Chunker> chunker_;
  std::shared_ptr<DisplayStage> display_;
  std::shared_ptr<TranslationStage> translation_;
  std::shared_ptr<RecognitionStage> recognition_;
};

#endif
