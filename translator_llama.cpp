//
//  translator_llama.cpp
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
#include <llama.h>

#include <algorithm>
#include <cstdio>
#include <mutex>
#include <sstream>
#include <stdexcept>

#include "translator_llama.hpp"
#include "utils.hpp"

static std::once_flag backend_once;

static void llama_log_quiet(enum ggml_log_level level, const char *text,
                            void * /*user_data*/) {
  if (level == GGML_LOG_LEVEL_ERROR && text != nullptr) {
    std::fputs(text, stderr);
  }
}

LlamaTranslator::~LlamaTranslator() {
  if (sampler_ != nullptr) {
    llama_sampler_free(sampler_);
    sampler_ = nullptr;
  }
  if (ctx_ != nullptr) {
    llama_free(ctx_);
    ctx_ = nullptr;
  }
  if (model_ != nullptr) {
    llama_model_free(model_);
    model_ = nullptr;
  }
}

bool LlamaTranslator::load_model() {
  if (ctx_ != nullptr)
    return true;

  std::call_once(backend_once, [] {
    llama_log_set(llama_log_quiet, nullptr);
    ggml_backend_load_all();
    llama_backend_init();
  });

  BOOST_LOG_SEV(log_, boost::log::trivial::info)
      << "llama:: loading model " << config_.get_llm_model() << " gpu layers "
      << config_.get_llm_gpu_layers();

  auto mparams = llama_model_default_params();
  mparams.n_gpu_layers = config_.get_llm_gpu_layers();
  mparams.use_mmap = true;
  model_ = llama_model_load_from_file(config_.get_llm_model().c_str(), mparams);
  if (model_ == nullptr) {
    BOOST_LOG_SEV(log_, boost::log::trivial::fatal)
        << "llama:: cannot load model " << config_.get_llm_model();
    return false;
  }
  vocab_ = llama_model_get_vocab(model_);

  auto cparams = llama_context_default_params();
  cparams.n_ctx = static_cast<uint32_t>(std::max(512, config_.get_llm_ctx()));
  cparams.n_batch = cparams.n_ctx;
  cparams.n_threads = std::max(1, config_.get_llm_threads());
  cparams.n_threads_batch = cparams.n_threads;
  cparams.no_perf = true;
  ctx_ = llama_init_from_model(model_, cparams);
  if (ctx_ == nullptr) {
    BOOST_LOG_SEV(log_, boost::log::trivial::fatal)
        << "llama:: cannot create context";
    llama_model_free(model_);
    model_ = nullptr;
    return false;
  }

  auto sparams = llama_sampler_chain_default_params();
  sparams.no_perf = true;
  sampler_ = llama_sampler_chain_init(sparams);
  llama_sampler_chain_add(sampler_, llama_sampler_init_greedy());

  BOOST_LOG_SEV(log_, boost::log::trivial::info)
      << "llama:: model loaded, context " << llama_n_ctx(ctx_);
  return true;
}

void LlamaTranslator::warm_up() {
  if (ctx_ == nullptr) {
    BOOST_LOG_SEV(log_, boost::log::trivial::warning)
        << "llama:: model not loaded, no warm up";
    return;
  }

  TimeElapsed te(log_, "llama:: warm up");
  try {
    auto out = generate("Hello", 10);
    BOOST_LOG_SEV(log_, boost::log::trivial::debug)
        << "llama:: warm up output: " << out;
  } catch (const std::exception &e) {
    BOOST_LOG_SEV(log_, boost::log::trivial::warning)
        << "llama:: warm up failed: " << e.what();
  }
}

std::string LlamaTranslator::build_prompt(const std::string &text,
                                          const ContextSnapshot &context) const {
  std::ostringstream prompt;
  prompt << "Translate the following " << config_.get_source_language()
         << " subtitle into " << config_.get_target_language()
         << ". Output the translation only, do not explain.\n";
  if (!context.empty()) {
    prompt << "\nConversation so far:\n" << context.render() << "\n";
  }
  prompt << '\n'
         << config_.get_source_language() << ": " << text << '\n'
         << config_.get_target_language() << ":";
  return prompt.str();
}

StageResult LlamaTranslator::translate(const std::string &text,
                                       const ContextSnapshot &context,
                                       std::string &out) {
  if (ctx_ == nullptr) {
    return StageResult::fatal("llama model not loaded");
  }
  try {
    out = postprocess(
        generate(build_prompt(text, context), config_.get_llm_max_tokens()));
  } catch (const std::runtime_error &e) {
    return StageResult::transient(std::string("llama:: ") + e.what());
  }
  return StageResult::ok();
}

StageResult LlamaTranslator::summarize(const std::string &prompt,
                                       std::string &out) {
  if (ctx_ == nullptr) {
    return StageResult::fatal("llama model not loaded");
  }
  try {
    out = postprocess(generate(prompt, 150));
  } catch (const std::runtime_error &e) {
    return StageResult::transient(std::string("llama:: ") + e.what());
  }
  return StageResult::ok();
}

std::string LlamaTranslator::generate(const std::string &prompt,
                                      int max_tokens) {
  llama_memory_clear(llama_get_memory(ctx_), true);
  llama_sampler_reset(sampler_);

  auto tokens = tokenize(prompt, true);
  max_tokens = std::max(1, max_tokens);
  if (tokens.size() + max_tokens >= llama_n_ctx(ctx_)) {
    throw std::runtime_error("prompt too long for context window (" +
                             std::to_string(tokens.size()) + " tokens)");
  }

  std::vector<llama_token> prompt_tokens(tokens.begin(), tokens.end());
  auto batch = llama_batch_get_one(prompt_tokens.data(),
                                   static_cast<int32_t>(prompt_tokens.size()));
  if (llama_decode(ctx_, batch) != 0) {
    throw std::runtime_error("llama_decode failed for prompt");
  }

  std::string generated;
  for (int i = 0; i < max_tokens; ++i) {
    llama_token tok = llama_sampler_sample(sampler_, ctx_, -1);
    if (llama_vocab_is_eog(vocab_, tok)) {
      break;
    }
    generated += token_to_piece(tok);
    /* one subtitle line is all we want */
    if (generated.find("\n\n") != std::string::npos) {
      break;
    }

    batch = llama_batch_get_one(&tok, 1);
    if (llama_decode(ctx_, batch) != 0) {
      throw std::runtime_error("llama_decode failed for continuation token");
    }
  }
  return generated;
}

std::string LlamaTranslator::postprocess(std::string text) const {
  text.erase(std::remove(text.begin(), text.end(), '\r'), text.end());

  auto marker = config_.get_target_language() + ":";
  auto marker_pos = text.find(marker);
  if (marker_pos != std::string::npos) {
    text = text.substr(marker_pos + marker.size());
  }
  boost::algorithm::trim(text);

  auto newline = text.find('\n');
  if (newline != std::string::npos) {
    text = text.substr(0, newline);
  }
  return boost::algorithm::trim_copy(text);
}

std::vector<int32_t> LlamaTranslator::tokenize(const std::string &text,
                                               bool add_special) const {
  const int32_t required =
      -llama_tokenize(vocab_, text.c_str(), static_cast<int32_t>(text.size()),
                      nullptr, 0, add_special, true);
  if (required <= 0) {
    throw std::runtime_error("llama_tokenize failed");
  }

  std::vector<llama_token> tokens(static_cast<size_t>(required));
  const int32_t written = llama_tokenize(
      vocab_, text.c_str(), static_cast<int32_t>(text.size()), tokens.data(),
      static_cast<int32_t>(tokens.size()), add_special, true);
  if (written < 0) {
    throw std::runtime_error("llama_tokenize failed while writing tokens");
  }
  tokens.resize(static_cast<size_t>(written));
  return std::vector<int32_t>(tokens.begin(), tokens.end());
}

std::string LlamaTranslator::token_to_piece(int32_t token) const {
  char local[256];
  const int first = llama_token_to_piece(vocab_, token, local,
                                         static_cast<int32_t>(sizeof(local)),
                                         0, true);
  if (first >= 0) {
    return std::string(local, static_cast<size_t>(first));
  }

  std::vector<char> dynamic(static_cast<size_t>(-first));
  const int second = llama_token_to_piece(vocab_, token, dynamic.data(),
                                          static_cast<int32_t>(dynamic.size()),
                                          0, true);
  if (second < 0) {
    throw std::runtime_error("llama_token_to_piece failed");
  }
  return std::string(dynamic.data(), static_cast<size_t>(second));
}
