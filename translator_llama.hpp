//
//  translator_llama.hpp
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

#ifndef _TRANSLATOR_LLAMA_HPP_
#define _TRANSLATOR_LLAMA_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "config.hpp"
#include "log.hpp"
#include "translator.hpp"

struct llama_model;
struct llama_context;
struct llama_sampler;
struct llama_vocab;

class LlamaTranslator : public Translator {
public:
  LlamaTranslator(const Config &config, const Logger &log)
      : config_(config), log_(log){};
  LlamaTranslator(const LlamaTranslator &) = delete;
  ~LlamaTranslator() override;

  bool load_model() override;
  void warm_up() override;
  StageResult translate(const std::string &text,
                        const ContextSnapshot &context,
                        std::string &out) override;
  StageResult summarize(const std::string &prompt, std::string &out) override;

  std::string build_prompt(const std::string &text,
                           const ContextSnapshot &context) const;

private:
  std::string generate(const std::string &prompt, int max_tokens);
  std::string postprocess(std::string text) const;
  std::vector<int32_t> tokenize(const std::string &text, bool add_special) const;
  std::string token_to_piece(int32_t token) const;

  const Config &config_;
  Logger log_;
  llama_model *model_{nullptr};
  const llama_vocab *vocab_{nullptr};
  llama_context *ctx_{nullptr};
  llama_sampler *sampler_{nullptr};
};

#endif
