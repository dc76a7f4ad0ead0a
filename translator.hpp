//
//  translator.hpp
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

#ifndef _TRANSLATOR_HPP_
#define _TRANSLATOR_HPP_

#include <cstdint>
#include <string>

#include "context_manager.hpp"
#include "stage_result.hpp"

struct TranslationRequest {
  std::string text;
  uint64_t segment_id{0};
  ContextSnapshot context; // copied when the request is built
};

struct TranslationResult {
  std::string original;
  std::string translation;
  ContextSnapshot context;
};

/* translation engine */
class Translator {
public:
  virtual ~Translator() = default;

  virtual bool load_model() = 0;
  virtual void warm_up() = 0;
  virtual StageResult translate(const std::string &text,
                                const ContextSnapshot &context,
                                std::string &out) = 0;
  /* free form generation, used for context summaries */
  virtual StageResult summarize(const std::string &prompt, std::string &out) {
    (void)prompt;
    out.clear();
    return StageResult::transient("summaries not supported");
  }
};

#endif
