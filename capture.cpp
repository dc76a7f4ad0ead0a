//
//  capture.cpp
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

#include <cstdlib>
#include <cstring>

#include "capture.hpp"
#include "chunker.hpp"

AlsaCapture::AlsaCapture(const Config &config, const Logger &log)
    : config_(config), log_(log) {}

AlsaCapture::~AlsaCapture() { stop(); }

std::vector<AudioDevice> AlsaCapture::list_devices() {
  std::vector<AudioDevice> devices;
  uint16_t channels = config_.get_channels();
  devices.push_back(AudioDevice{0, "default", channels, kSampleRate});

  void **hints{nullptr};
  int err = snd_device_name_hint(-1, "pcm", &hints);
  if (err < 0) {
    BOOST_LOG_SEV(log_, boost::log::trivial::error)
        << "capture:: cannot list devices: " << snd_strerror(err);
    return devices;
  }

  int index = 1;
  for (void **hint = hints; *hint != nullptr; hint++) {
    char *name = snd_device_name_get_hint(*hint, "NAME");
    /* a missing IOID means the device supports both directions */
    char *ioid = snd_device_name_get_hint(*hint, "IOID");
    if (name != nullptr && std::strcmp(name, "default") != 0 &&
        (ioid == nullptr || std::strcmp(ioid, "Input") == 0)) {
      devices.push_back(AudioDevice{index++, name, channels, kSampleRate});
    }
    std::free(name);
    std::free(ioid);
  }
  snd_device_name_free_hint(hints);

  return devices;
}

bool AlsaCapture::start(int device_index, SamplesCallback callback) {
  if (running_)
    return true;
  /* capture loop ended on its own */
  if (thread_.joinable()) {
    thread_.join();
    close();
  }

  auto devices = list_devices();
  if (device_index < 0 || device_index >= static_cast<int>(devices.size())) {
    BOOST_LOG_SEV(log_, boost::log::trivial::error)
        << "capture:: no device with index " << device_index;
    return false;
  }

  channels_ = config_.get_channels();
  if (!open(devices[device_index].name)) {
    return false;
  }

  buffer_.resize(chunk_samples_ * channels_);
  mono_.resize(chunk_samples_);
  callback_ = std::move(callback);
  running_ = true;

  thread_ = std::thread(&AlsaCapture::capture_loop, this);
  return true;
}

void AlsaCapture::stop() {
  if (!running_ && !thread_.joinable())
    return;

  BOOST_LOG_SEV(log_, boost::log::trivial::info)
      << "capture:: stopping audio capture ... ";
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
  close();
}

bool AlsaCapture::open(const std::string &device_name) {
  BOOST_LOG_SEV(log_, boost::log::trivial::info)
      << "capture:: opening " << device_name << " rate " << kSampleRate
      << " channels " << int(channels_);

  int err = snd_pcm_open(&pcm_, device_name.c_str(), SND_PCM_STREAM_CAPTURE, 0);
  if (err < 0) {
    BOOST_LOG_SEV(log_, boost::log::trivial::fatal)
        << "capture:: cannot open " << device_name << ": " << snd_strerror(err);
    pcm_ = nullptr;
    return false;
  }

  err = snd_pcm_set_params(pcm_, SND_PCM_FORMAT_S16_LE,
                           SND_PCM_ACCESS_RW_INTERLEAVED, channels_,
                           kSampleRate, 1 /* soft resample */,
                           500000 /* us */);
  if (err < 0) {
    BOOST_LOG_SEV(log_, boost::log::trivial::fatal)
        << "capture:: cannot set parameters: " << snd_strerror(err);
    close();
    return false;
  }

  err = snd_pcm_prepare(pcm_);
  if (err < 0) {
    BOOST_LOG_SEV(log_, boost::log::trivial::fatal)
        << "capture:: cannot prepare device: " << snd_strerror(err);
    close();
    return false;
  }
  return true;
}

void AlsaCapture::close() {
  if (pcm_ != nullptr) {
    snd_pcm_drop(pcm_);
    snd_pcm_close(pcm_);
    pcm_ = nullptr;
  }
}

void AlsaCapture::capture_loop() {
  BOOST_LOG_SEV(log_, boost::log::trivial::debug)
      << "capture:: audio capture loop start, chunk_samples = "
      << chunk_samples_;

  while (running_) {
    auto frames = snd_pcm_readi(pcm_, buffer_.data(), chunk_samples_);
    if (frames < 0) {
      BOOST_LOG_SEV(log_, boost::log::trivial::warning)
          << "capture:: read failed: " << snd_strerror(frames);
      if (snd_pcm_recover(pcm_, frames, 1) < 0) {
        BOOST_LOG_SEV(log_, boost::log::trivial::error)
            << "capture:: cannot recover, stopping";
        break;
      }
      continue;
    }

    /* downmix interleaved pcm to mono float */
    for (snd_pcm_sframes_t offset = 0; offset < frames; offset++) {
      float pcm_float{0};
      for (uint8_t ch = 0; ch < channels_; ch++) {
        pcm_float +=
            static_cast<float>(buffer_[offset * channels_ + ch]) / 32768.0f;
      }
      mono_[offset] = pcm_float / channels_;
    }

    if (!callback_(mono_.data(), static_cast<size_t>(frames))) {
      BOOST_LOG_SEV(log_, boost::log::trivial::error)
          << "capture:: samples not accepted, stopping capture";
      break;
    }
  }

  running_ = false;
  BOOST_LOG_SEV(log_, boost::log::trivial::debug)
      << "capture:: audio capture loop end";
}
