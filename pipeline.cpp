//
//  pipeline.cpp
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
#include <future>
#include <stdexcept>
#include <thread>

#include "display_stage.hpp"
#include "pipeline.hpp"
#include "utils.hpp"

using namespace std::chrono_literals;

/* one chunk waiting while the next is captured */
static constexpr size_t kAudioQueueSize = 1;
static constexpr size_t kTextQueueSize = 2;
static constexpr size_t kDisplayQueueSize = 8;
/* extra time given to threads woken by a cancel after the deadline */
static constexpr auto kAbortGrace = 200ms;

std::shared_ptr<Pipeline>
Pipeline::create(const Config &config, std::shared_ptr<AudioSource> audio,
                 std::shared_ptr<Recognizer> recognizer,
                 std::shared_ptr<Translator> translator,
                 std::shared_ptr<ContextManager> context, const Logger &log) {
  return std::shared_ptr<Pipeline>(
      new Pipeline(config, std::move(audio), std::move(recognizer),
                   std::move(translator), std::move(context), log));
}

Pipeline::Pipeline(const Config &config, std::shared_ptr<AudioSource> audio,
                   std::shared_ptr<Recognizer> recognizer,
                   std::shared_ptr<Translator> translator,
                   std::shared_ptr<ContextManager> context, const Logger &log)
    : config_(config), audio_(std::move(audio)),
      recognizer_(std::move(recognizer)), translator_(std::move(translator)),
      context_(std::move(context)), log_(log) {
  if (!audio_ || !recognizer_ || !translator_ || !context_) {
    throw std::invalid_argument("pipeline:: missing collaborator");
  }
}

Pipeline::~Pipeline() { stop(); }

const char *Pipeline::to_string(State state) {
  switch (state) {
  case State::idle:
    return "idle";
  case State::starting:
    return "starting";
  case State::running:
    return "running";
  case State::stopping:
    return "stopping";
  case State::stopped:
    return "stopped";
  case State::error:
    return "error";
  }
  return "unknown";
}

void Pipeline::set_state(State state) {
  BOOST_LOG_SEV(log_, boost::log::trivial::debug)
      << "pipeline:: " << to_string(state_.load()) << " -> "
      << to_string(state);
  state_ = state;
}

void Pipeline::set_callbacks(PartialCallback on_partial,
                             TranslationCallback on_translation) {
  std::lock_guard<std::mutex> lock(control_mutex_);
  on_partial_ = std::move(on_partial);
  on_translation_ = std::move(on_translation);
}

std::vector<AudioDevice> Pipeline::list_devices() {
  return audio_->list_devices();
}

bool Pipeline::start(int device_index) {
  std::lock_guard<std::mutex> lock(control_mutex_);
  auto state = state_.load();
  if (state != State::idle && state != State::stopped &&
      state != State::error) {
    BOOST_LOG_SEV(log_, boost::log::trivial::warning)
        << "pipeline:: cannot start while " << to_string(state);
    return false;
  }
  /* an abandoned thread may still be inside an engine call */
  auto lagging = prune_abandoned();
  if (lagging > 0) {
    BOOST_LOG_SEV(log_, boost::log::trivial::error)
        << "pipeline:: cannot start, " << lagging
        << " threads of the previous run are still busy";
    return false;
  }

  BOOST_LOG_SEV(log_, boost::log::trivial::info)
      << "pipeline:: starting on device " << device_index << " ...";
  set_state(State::starting);
  timed_out_ = false;

  try {
    if (!start_stages(device_index)) {
      return false;
    }
  } catch (const std::exception &e) {
    return fail(std::string("exception during start: ") + e.what());
  }

  set_state(State::running);
  BOOST_LOG_SEV(log_, boost::log::trivial::info) << "pipeline:: running";
  return true;
}

bool Pipeline::start_stages(int device_index) {
  recognition_.reset();
  translation_.reset();
  display_.reset();
  chunker_.reset();

  audio_queue_ = std::make_shared<BoundedQueue<AudioChunk>>(
      "audio", kAudioQueueSize, log_);
  text_queue_ = std::make_shared<BoundedQueue<RecognitionResult>>(
      "text", kTextQueueSize, log_);
  display_queue_ = std::make_shared<BoundedQueue<DisplayEvent>>(
      "display", kDisplayQueueSize, log_);

  /* consumers first, nothing produces into a queue nobody reads */
  display_ = std::make_shared<DisplayStage>(on_partial_, on_translation_,
                                            display_queue_, log_);
  display_->start();

  {
    TimeElapsed te(log_, "pipeline:: translation model load");
    if (!translator_->load_model()) {
      return fail("cannot load translation model");
    }
    translator_->warm_up();
  }
  translation_ = std::make_shared<TranslationStage>(translator_, context_,
                                                    text_queue_, log_);
  translation_->set_sink([display = display_queue_](TranslationResult &&res) {
    return display->push(DisplayEvent::translated(std::move(res.original),
                                                  std::move(res.translation),
                                                  res.context.render()),
                         Delivery::must_deliver);
  });
  translation_->set_on_exit([display = display_queue_] { display->close(); });
  translation_->start();

  {
    TimeElapsed te(log_, "pipeline:: recognition model load");
    if (!recognizer_->load_model()) {
      return fail("cannot load recognition model");
    }
    recognizer_->warm_up();
  }
  recognition_ =
      std::make_shared<RecognitionStage>(recognizer_, audio_queue_, log_);
  recognition_->set_sink([text = text_queue_, display = display_queue_](
                             RecognitionResult &&res) {
    if (res.is_final_segment) {
      return text->push(std::move(res), Delivery::must_deliver);
    }
    /* a dropped partial is counted by the queue, not an error */
    display->push(DisplayEvent::partial(std::move(res.text)),
                  Delivery::droppable);
    return true;
  });
  recognition_->set_on_exit([text = text_queue_] { text->close(); });
  recognition_->start();

  chunker_ = std::make_shared<Chunker>(config_.get_chunk_duration(),
                                       kSampleRate, log_);
  chunker_->set_callback([audio = audio_queue_](AudioChunk &&chunk) {
    return audio->push(std::move(chunk), Delivery::must_deliver);
  });
  if (!audio_->start(device_index,
                     [chunker = chunker_](const float *samples, size_t count) {
                       return chunker->push(samples, count);
                     })) {
    return fail("cannot start audio capture on device " +
                std::to_string(device_index));
  }
  return true;
}

bool Pipeline::fail(const std::string &reason) {
  BOOST_LOG_SEV(log_, boost::log::trivial::fatal) << "pipeline:: " << reason;
  audio_->stop();
  cancel_all();
  if (!join_all(std::chrono::steady_clock::now() +
                std::chrono::milliseconds(config_.get_shutdown_grace_ms()))) {
    timed_out_ = true;
  }
  set_state(State::error);
  return false;
}

void Pipeline::cancel_all() {
  if (audio_queue_) {
    audio_queue_->cancel();
  }
  if (text_queue_) {
    text_queue_->cancel();
  }
  if (display_queue_) {
    display_queue_->cancel();
  }
  if (recognition_) {
    recognition_->request_stop();
  }
  if (translation_) {
    translation_->request_stop();
  }
  if (display_) {
    display_->request_stop();
  }
}

bool Pipeline::join_all(std::chrono::steady_clock::time_point deadline) {
  bool clean{true};
  auto join = [&](auto &worker) {
    if (!worker) {
      return;
    }
    auto until =
        clean ? deadline : std::chrono::steady_clock::now() + kAbortGrace;
    if (worker->wait_until(until)) {
      return;
    }
    abandoned_.push_back(
        [lagging = worker] { return lagging->is_running(); });
    if (clean) {
      clean = false;
      /* wake whatever is still blocked on a queue */
      cancel_all();
    }
  };
  join(recognition_);
  join(translation_);
  join(display_);
  return clean;
}

void Pipeline::stop() {
  std::lock_guard<std::mutex> lock(control_mutex_);
  if (state_ != State::running) {
    BOOST_LOG_SEV(log_, boost::log::trivial::debug)
        << "pipeline:: stop ignored while " << to_string(state_.load());
    return;
  }

  BOOST_LOG_SEV(log_, boost::log::trivial::info) << "pipeline:: stopping ...";
  set_state(State::stopping);
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(config_.get_shutdown_grace_ms());

  /* capture and flush may block on a full audio queue */
  auto done = std::make_shared<std::promise<void>>();
  auto drained = done->get_future().share();
  std::thread drain([audio = audio_, chunker = chunker_, log = log_,
                     done]() mutable {
    try {
      audio->stop();
      if (!chunker->flush()) {
        BOOST_LOG_SEV(log, boost::log::trivial::error)
            << "pipeline:: last chunk could not be queued";
      }
    } catch (const std::exception &e) {
      BOOST_LOG_SEV(log, boost::log::trivial::error)
          << "pipeline:: audio stop failed: " << e.what();
    }
    done->set_value();
  });
  if (drained.wait_until(deadline) != std::future_status::ready) {
    BOOST_LOG_SEV(log_, boost::log::trivial::error)
        << "pipeline:: audio source did not stop in time";
    timed_out_ = true;
    cancel_all();
  }
  if (drained.wait_for(kAbortGrace) == std::future_status::ready) {
    drain.join();
  } else {
    BOOST_LOG_SEV(log_, boost::log::trivial::error)
        << "pipeline:: audio source stop abandoned";
    drain.detach();
    abandoned_.push_back([drained] {
      return drained.wait_for(std::chrono::seconds(0)) !=
             std::future_status::ready;
    });
  }
  /* end of stream, each stage drains and closes the next queue */
  audio_queue_->close();

  if (!join_all(deadline)) {
    timed_out_ = true;
    BOOST_LOG_SEV(log_, boost::log::trivial::error)
        << "pipeline:: shutdown timeout, lagging workers abandoned";
  }

  auto stats = get_stats();
  BOOST_LOG_SEV(log_, boost::log::trivial::info)
      << "pipeline:: stopped, chunks " << stats.chunks << " translations "
      << stats.translations << " dropped partials " << stats.dropped_partials
      << " dropped finals " << stats.dropped_finals;
  set_state(State::stopped);
}

size_t Pipeline::prune_abandoned() {
  abandoned_.erase(std::remove_if(abandoned_.begin(), abandoned_.end(),
                                  [](const std::function<bool()> &busy) {
                                    return !busy();
                                  }),
                   abandoned_.end());
  return abandoned_.size();
}

bool Pipeline::is_faulted() const {
  return (recognition_ && recognition_->is_faulted()) ||
         (translation_ && translation_->is_faulted()) ||
         (display_ && display_->is_faulted());
}

Pipeline::Stats Pipeline::get_stats() const {
  Stats stats;
  if (chunker_) {
    stats.chunks = chunker_->get_chunks_emitted();
  }
  if (recognition_) {
    stats.partials = recognition_->get_partials();
    stats.finals = recognition_->get_finals();
    stats.failed_items += recognition_->get_failed();
  }
  if (translation_) {
    stats.failed_items += translation_->get_failed();
  }
  if (display_) {
    stats.translations = display_->get_translations();
  }
  if (audio_queue_) {
    stats.dropped_partials += audio_queue_->dropped();
    stats.dropped_finals += audio_queue_->dropped_finals();
  }
  if (text_queue_) {
    stats.dropped_partials += text_queue_->dropped();
    stats.dropped_finals += text_queue_->dropped_finals();
  }
  if (display_queue_) {
    stats.dropped_partials += display_queue_->dropped();
    stats.dropped_finals += display_queue_->dropped_finals();
  }
  return stats;
}
