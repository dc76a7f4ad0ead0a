//
//  display_stage.hpp
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

#ifndef _DISPLAY_STAGE_HPP_
#define _DISPLAY_STAGE_HPP_

#include <atomic>
#include <functional>
#include <memory>
#include <string>

#include "display_channel.hpp"
#include "stage_worker.hpp"

/* last stage, hands partials and translations to the display callbacks */
class DisplayStage : public StageWorker<DisplayEvent, DisplayEvent> {
public:
  using PartialCallback = std::function<void(const std::string &)>;
  using TranslationCallback = std::function<void(
      const std::string &, const std::string &, const std::string &)>;

  DisplayStage(PartialCallback on_partial, TranslationCallback on_translation,
               std::shared_ptr<InputQueue> input, const Logger &log)
      : StageWorker("display", std::move(input), log),
        on_partial_(std::move(on_partial)),
        on_translation_(std::move(on_translation)) {}

  uint64_t get_translations() const { return translations_; }

protected:
  StageResult process(DisplayEvent &event, const Sink &) override {
    if (event.type == DisplayEvent::Type::partial) {
      if (on_partial_) {
        on_partial_(event.text);
      }
    } else {
      translations_++;
      if (on_translation_) {
        on_translation_(event.text, event.translation, event.context);
      }
    }
    return StageResult::ok();
  }

private:
  PartialCallback on_partial_;
  TranslationCallback on_translation_;
  std::atomic<uint64_t> translations_{0};
};

#endif
