//
//  recognition_stage.cpp
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

#include <exception>

#include "recognition_stage.hpp"
#include "utils.hpp"

StageResult RecognitionStage::process(AudioChunk &chunk, const Sink &sink) {
  TimeElapsed te(log_, "recognition:: chunk " + std::to_string(chunk.sequence));
  BOOST_LOG_SEV(log_, boost::log::trivial::debug)
      << "recognition:: chunk " << chunk.sequence << " samples "
      << chunk.samples.size() << (chunk.is_final ? " (final)" : "");

  bool delivered{true};
  auto emit = [&](const std::string &text, bool final) {
    RecognitionResult result;
    result.sequence = chunk.sequence;
    result.segment_id = segment_id_;
    result.token_index = token_index_++;
    result.text = text;
    result.is_final_segment = final;

    if (final) {
      segment_id_++;
      token_index_ = 0;
      finals_++;
    } else {
      partials_++;
    }

    if (!sink(std::move(result)) && final) {
      delivered = false;
    }
  };

  auto res = StageResult::ok();
  try {
    res = recognizer_->transcribe(chunk, emit);
  } catch (const std::exception &) {
    abandon_segment();
    throw;
  }

  if (!delivered) {
    return StageResult::fatal("recognized segment could not be delivered");
  }
  if (!res.is_ok()) {
    abandon_segment();
  }
  return res;
}

void RecognitionStage::abandon_segment() {
  if (token_index_ == 0) {
    return;
  }
  /* partials of a failed chunk never get a final, start a new segment */
  BOOST_LOG_SEV(log_, boost::log::trivial::debug)
      << "recognition:: segment " << segment_id_ << " abandoned after "
      << token_index_ << " partials";
  segment_id_++;
  token_index_ = 0;
}
