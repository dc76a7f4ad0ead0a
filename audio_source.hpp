//
//  audio_source.hpp
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

#ifndef _AUDIO_SOURCE_HPP_
#define _AUDIO_SOURCE_HPP_

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

struct AudioDevice {
  int index{0};
  std::string name;
  uint16_t channels{0};
  uint32_t sample_rate{0};
};

/*
 * Capture driver, delivers mono float samples at kSampleRate from its own
 * thread. Capture ends when the callback returns false. stop() must be
 * safe to call when not started.
 */
class AudioSource {
public:
  using SamplesCallback =
      std::function<bool(const float *samples, size_t count)>;

  virtual ~AudioSource() = default;

  virtual std::vector<AudioDevice> list_devices() = 0;
  virtual bool start(int device_index, SamplesCallback callback) = 0;
  virtual void stop() = 0;
};

#endif
