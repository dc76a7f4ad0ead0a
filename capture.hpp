//
//  capture.hpp
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

#ifndef _CAPTURE_HPP_
#define _CAPTURE_HPP_

#include <alsa/asoundlib.h>
#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "audio_source.hpp"
#include "config.hpp"
#include "log.hpp"

class AlsaCapture : public AudioSource {
public:
  AlsaCapture(const Config &config, const Logger &log);
  AlsaCapture(const AlsaCapture &) = delete;
  ~AlsaCapture() override;

  std::vector<AudioDevice> list_devices() override;
  bool start(int device_index, SamplesCallback callback) override;
  void stop() override;

private:
  bool open(const std::string &device_name);
  void close();
  void capture_loop();

  const Config &config_;
  Logger log_;
  snd_pcm_t *pcm_{nullptr};
  uint8_t channels_{1};
  snd_pcm_uframes_t chunk_samples_{1600}; // 100 ms
  std::vector<int16_t> buffer_;
  std::vector<float> mono_;
  SamplesCallback callback_;
  std::thread thread_;
  std::atomic_bool running_{false};
};

#endif
