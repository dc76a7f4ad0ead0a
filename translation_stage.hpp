//
//  translation_stage.hpp
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

#ifndef _TRANSLATION_STAGE_HPP_
#define _TRANSLATION_STAGE_HPP_

#include <memory>

#include "context_manager.hpp"
#include "recognizer.hpp"
#include "stage_worker.hpp"
#include "translator.hpp"

/*
 * Translates finalized segments. Each request carries a copy of the context
 * taken before the call, the new turn is recorded only after a successful
 * translation.
 */
class TranslationStage
    : public StageWorker<RecognitionResult, TranslationResult> {
public:
  TranslationStage(std::shared_ptr<Translator> translator,
                   std::shared_ptr<ContextManager> context,
                   std::shared_ptr<InputQueue> input, const Logger &log)
      : StageWorker("translation", std::move(input), log),
        translator_(std::move(translator)), context_(std::move(context)) {}

  TranslationRequest build_request(const RecognitionResult &result) const;

protected:
  StageResult process(RecognitionResult &result, const Sink &sink) override;

private:
  std::shared_ptr<Translator> translator_;
  std::shared_ptr<ContextManager> context_;
};

#endif
