//
//  recognizer.hpp
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

#ifndef _RECOGNIZER_HPP_
#define _RECOGNIZER_HPP_

#include <cstdint>
#include <functional>
#include <string>

#include "chunker.hpp"
#include "stage_result.hpp"

struct RecognitionResult {
  uint64_t sequence{0};   // source chunk
  uint64_t segment_id{0}; // groups the partials of one utterance
  uint32_t token_index{0};
  std::string text;
  bool is_final_segment{false};
};

/* speech recognition engine */
class Recognizer {
public:
  /* called with the growing partial text, then once with final=true */
  using Emit = std::function<void(const std::string &text, bool final)>;

  virtual ~Recognizer() = default;

  virtual bool load_model() = 0;
  virtual void warm_up() = 0;
  virtual StageResult transcribe(const AudioChunk &chunk, const Emit &emit) = 0;
};

#endif
