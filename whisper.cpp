//
//  whisper.cpp
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
#include <algorithm>
#include <cmath>
#include <thread>

#include "utils.hpp"
#include "whisper.hpp"

static void whisper_log_quiet(enum ggml_log_level level, const char *text,
                              void *user_data) {
  if (level == GGML_LOG_LEVEL_ERROR && text != nullptr) {
    auto *log = static_cast<Logger *>(user_data);
    BOOST_LOG_SEV(*log, boost::log::trivial::error)
        << "whisper:: " << boost::algorithm::trim_right_copy(std::string(text));
  }
}

static bool is_annotation(const std::string &text) {
  /* [BLANK_AUDIO], (music) and similar */
  return text.size() >= 2 &&
         ((text.front() == '[' && text.back() == ']') ||
          (text.front() == '(' && text.back() == ')'));
}

WhisperRecognizer::~WhisperRecognizer() {
  if (ctx_ != nullptr) {
    whisper_free(ctx_);
    ctx_ = nullptr;
  }
}

bool WhisperRecognizer::load_model() {
  if (ctx_ != nullptr)
    return true;

  whisper_log_set(whisper_log_quiet, &log_);

  BOOST_LOG_SEV(log_, boost::log::trivial::info)
      << "whisper:: loading model " << config_.get_model();
  auto cparams = whisper_context_default_params();
  ctx_ = whisper_init_from_file_with_params(config_.get_model().c_str(),
                                            cparams);
  if (ctx_ == nullptr) {
    BOOST_LOG_SEV(log_, boost::log::trivial::fatal)
        << "whisper:: cannot load model " << config_.get_model();
    return false;
  }

  if (!config_.get_openvino_device().empty()) {
    /* falls back to the default encoder when OpenVINO is not available */
    whisper_ctx_init_openvino_encoder(
        ctx_, nullptr, config_.get_openvino_device().c_str(), nullptr);
  }

  prompt_tokens_.clear();
  BOOST_LOG_SEV(log_, boost::log::trivial::info)
      << "whisper:: model loaded, language " << config_.get_language();
  return true;
}

void WhisperRecognizer::warm_up() {
  if (ctx_ == nullptr) {
    BOOST_LOG_SEV(log_, boost::log::trivial::warning)
        << "whisper:: model not loaded, no warm up";
    return;
  }

  TimeElapsed te(log_, "whisper:: warm up");
  std::vector<float> silence(kSampleRate, 0.0f);
  if (!run(silence.data(), silence.size())) {
    BOOST_LOG_SEV(log_, boost::log::trivial::warning)
        << "whisper:: warm up failed";
  }
  prompt_tokens_.clear();
}

StageResult WhisperRecognizer::transcribe(const AudioChunk &chunk,
                                          const Emit &emit) {
  if (ctx_ == nullptr) {
    return StageResult::fatal("whisper model not loaded");
  }
  if (chunk.samples.empty()) {
    return StageResult::ok();
  }

  double energy{0};
  for (auto sample : chunk.samples) {
    energy += sample * sample;
  }
  auto rms = std::sqrt(energy / chunk.samples.size());
  if (rms < config_.get_silence_threshold()) {
    BOOST_LOG_SEV(log_, boost::log::trivial::debug)
        << "whisper:: skipping silent chunk " << chunk.sequence << " rms "
        << rms;
    return StageResult::ok();
  }

  if (!run(chunk.samples.data(), chunk.samples.size())) {
    return StageResult::transient("whisper_full failed on chunk " +
                                  std::to_string(chunk.sequence));
  }
  emit_segments(emit);
  return StageResult::ok();
}

bool WhisperRecognizer::run(const float *in, uint32_t samples_in) {
  auto wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
  wparams.print_progress = false;
  wparams.print_special = false;
  wparams.print_realtime = false;
  wparams.print_timestamps = false;
  wparams.translate = false;
  wparams.single_segment = false;
  wparams.suppress_blank = true;
  wparams.language = config_.get_language().c_str();
  wparams.n_threads =
      std::max(1, std::min(4, int(std::thread::hardware_concurrency())));
  wparams.no_context = !config_.get_use_context();
  if (config_.get_use_context() && !prompt_tokens_.empty()) {
    wparams.prompt_tokens = prompt_tokens_.data();
    wparams.prompt_n_tokens = prompt_tokens_.size();
  }
  if (config_.get_vad_enabled()) {
    wparams.vad = true;
    wparams.vad_model_path = config_.get_vad_model().c_str();
    wparams.vad_params = whisper_vad_default_params();
    wparams.vad_params.threshold = config_.get_vad_threshold();
  }

  if (whisper_full(ctx_, wparams, in, samples_in) != 0) {
    BOOST_LOG_SEV(log_, boost::log::trivial::error)
        << "whisper:: failed to process audio";
    return false;
  }

  if (config_.get_use_context()) {
    prompt_tokens_.clear();
    const int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
      const int token_count = whisper_full_n_tokens(ctx_, i);
      for (int j = 0; j < token_count; ++j) {
        prompt_tokens_.push_back(whisper_full_get_token_id(ctx_, i, j));
      }
    }
  }
  return true;
}

void WhisperRecognizer::emit_segments(const Emit &emit) {
  const whisper_token eot = whisper_token_eot(ctx_);
  const int n_segments = whisper_full_n_segments(ctx_);

  for (int i = 0; i < n_segments; ++i) {
    std::string segment = boost::algorithm::trim_copy(
        std::string(whisper_full_get_segment_text(ctx_, i)));
    if (segment.empty() || is_annotation(segment)) {
      continue;
    }

    /* growing token text as partials, the segment text as final */
    std::string tokens;
    std::string last;
    const int token_count = whisper_full_n_tokens(ctx_, i);
    for (int j = 0; j < token_count; ++j) {
      if (whisper_full_get_token_id(ctx_, i, j) >= eot) {
        continue; // special tokens
      }
      tokens += whisper_full_get_token_text(ctx_, i, j);
      auto partial = boost::algorithm::trim_copy(
          tokens.substr(0, tokens.size() - utf8_incomplete_tail(tokens)));
      if (!partial.empty() && partial != last && partial != segment) {
        emit(partial, false);
        last = partial;
      }
    }
    emit(segment, true);
  }
}
