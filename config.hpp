//
//  config.hpp
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

#ifndef _CONFIG_HPP_
#define _CONFIG_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

class Config {
 public:
  int get_device_index() const { return device_index_; }
  uint8_t get_channels() const { return channels_; }
  float get_chunk_duration() const { return chunk_duration_; }
  uint16_t get_context_window_size() const { return context_window_size_; }
  uint16_t get_update_context_interval() const {
    return update_context_interval_;
  }
  const std::string& get_summary_mode() const { return summary_mode_; }
  float get_silence_threshold() const { return silence_threshold_; }
  const std::string& get_model() const { return model_; }
  const std::string& get_language() const { return language_; }
  const std::string& get_openvino_device() const { return openvino_device_; }
  bool get_use_context() const { return use_context_; };
  bool get_vad_enabled() const { return vad_enabled_; };
  const std::string& get_vad_model() const { return vad_model_; };
  float get_vad_threshold() const { return vad_threshold_; };
  const std::string& get_llm_model() const { return llm_model_; }
  int get_llm_gpu_layers() const { return llm_gpu_layers_; }
  int get_llm_ctx() const { return llm_ctx_; }
  int get_llm_threads() const { return llm_threads_; }
  int get_llm_max_tokens() const { return llm_max_tokens_; }
  const std::string& get_source_language() const { return source_language_; }
  const std::string& get_target_language() const { return target_language_; }
  uint32_t get_shutdown_grace_ms() const { return shutdown_grace_ms_; }
  int get_log_severity() const { return log_severity_; };

  void set_device_index(int device_index) { device_index_ = device_index; }
  void set_channels(uint8_t channels) { channels_ = channels; }
  void set_chunk_duration(float chunk_duration) {
    chunk_duration_ = chunk_duration;
  }
  void set_context_window_size(uint16_t context_window_size) {
    context_window_size_ = context_window_size;
  }
  void set_update_context_interval(uint16_t update_context_interval) {
    update_context_interval_ = update_context_interval;
  }
  void set_summary_mode(std::string_view summary_mode) {
    summary_mode_ = summary_mode;
  }
  void set_silence_threshold(float silence_threshold) {
    silence_threshold_ = silence_threshold;
  }
  void set_model(const std::string& model) { model_ = model; }
  void set_language(const std::string& language) { language_ = language; }
  void set_openvino_device(const std::string& openvino_device) {
    openvino_device_ = openvino_device;
  }
  void set_use_context(bool use_context) { use_context_ = use_context; };
  void set_vad_enabled(bool vad_enabled) { vad_enabled_ = vad_enabled; };
  void set_vad_model(const std::string& vad_model) { vad_model_ = vad_model; };
  void set_vad_threshold(float vad_threshold) {
    vad_threshold_ = vad_threshold;
  };
  void set_llm_model(const std::string& llm_model) { llm_model_ = llm_model; }
  void set_llm_gpu_layers(int llm_gpu_layers) {
    llm_gpu_layers_ = llm_gpu_layers;
  }
  void set_llm_ctx(int llm_ctx) { llm_ctx_ = llm_ctx; }
  void set_llm_threads(int llm_threads) { llm_threads_ = llm_threads; }
  void set_llm_max_tokens(int llm_max_tokens) {
    llm_max_tokens_ = llm_max_tokens;
  }
  void set_source_language(const std::string& source_language) {
    source_language_ = source_language;
  }
  void set_target_language(const std::string& target_language) {
    target_language_ = target_language;
  }
  void set_shutdown_grace_ms(uint32_t shutdown_grace_ms) {
    shutdown_grace_ms_ = shutdown_grace_ms;
  }
  void set_log_severity(int log_severity) { log_severity_ = log_severity; };

 private:
  int device_index_{0};
  uint8_t channels_{1};
  float chunk_duration_{2.0f};
  uint16_t context_window_size_{5};
  uint16_t update_context_interval_{3};
  std::string summary_mode_{"simple"};
  float silence_threshold_{1e-2};
  std::string model_{"./models/ggml-medium.bin"};
  std::string language_{"ja"};
  std::string openvino_device_{""};
  bool use_context_{false};
  bool vad_enabled_{false};
  std::string vad_model_{"./models/ggml-silero-v5.1.2.bin"};
  float vad_threshold_{5e-1};
  std::string llm_model_{"./models/qwen2.5-7b-instruct-q4_k_m.gguf"};
  int llm_gpu_layers_{35};
  int llm_ctx_{2048};
  int llm_threads_{8};
  int llm_max_tokens_{200};
  std::string source_language_{"Japanese"};
  std::string target_language_{"Traditional Chinese"};
  uint32_t shutdown_grace_ms_{3000};
  int log_severity_{2};
};

#endif
