//
//  translation_stage.cpp
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

#include "translation_stage.hpp"
#include "utils.hpp"

TranslationRequest
TranslationStage::build_request(const RecognitionResult &result) const {
  TranslationRequest request;
  request.text = boost::algorithm::trim_copy(result.text);
  request.segment_id = result.segment_id;
  request.context = context_->snapshot();
  return request;
}

StageResult TranslationStage::process(RecognitionResult &result,
                                      const Sink &sink) {
  if (!result.is_final_segment) {
    BOOST_LOG_SEV(log_, boost::log::trivial::trace)
        << "translation:: ignoring partial of segment " << result.segment_id;
    return StageResult::ok();
  }

  auto request = build_request(result);
  if (request.text.empty()) {
    BOOST_LOG_SEV(log_, boost::log::trivial::debug)
        << "translation:: segment " << request.segment_id
        << " is blank, skipping";
    return StageResult::ok();
  }

  std::string translation;
  {
    TimeElapsed te(log_, "translation:: segment " +
                             std::to_string(request.segment_id));
    auto res = translator_->translate(request.text, request.context,
                                      translation);
    if (!res.is_ok()) {
      return res;
    }
  }

  boost::algorithm::trim(translation);
  if (translation.empty()) {
    return StageResult::transient("empty translation for segment " +
                                  std::to_string(request.segment_id));
  }

  context_->record_turn(
      ContextEntry{request.text, translation, request.segment_id});

  TranslationResult out;
  out.original = std::move(request.text);
  out.translation = std::move(translation);
  out.context = std::move(request.context);
  if (!sink(std::move(out))) {
    return StageResult::fatal("translation could not be delivered");
  }
  return StageResult::ok();
}
