//
//  whisper.hpp
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

#ifndef _WHISPER_HPP_
#define _WHISPER_HPP_

#include <string>
#include <vector>
#include <whisper.h>

#include "config.hpp"
#include "log.hpp"
#include "recognizer.hpp"

class WhisperRecognizer : public Recognizer {
public:
  WhisperRecognizer(const Config &config, const Logger &log)
      : config_(config), log_(log){};
  WhisperRecognizer(const WhisperRecognizer &) = delete;
  ~WhisperRecognizer() override;

  bool load_model() override;
  void warm_up() override;
  StageResult transcribe(const AudioChunk &chunk, const Emit &emit) override;

private:
  bool run(const float *in, uint32_t samples_in);
  void emit_segments(const Emit &emit);

  const Config &config_;
  Logger log_;
  std::vector<whisper_token> prompt_tokens_;
  struct whisper_context *ctx_{nullptr};
};

#endif
