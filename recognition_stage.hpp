//
//  recognition_stage.hpp
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

#ifndef _RECOGNITION_STAGE_HPP_
#define _RECOGNITION_STAGE_HPP_

#include <atomic>
#include <memory>

#include "chunker.hpp"
#include "recognizer.hpp"
#include "stage_worker.hpp"

/*
 * Runs the recognizer on each chunk. Results are stamped with the chunk
 * sequence, a segment id that changes after every final result and a token
 * index that restarts with each segment.
 */
class RecognitionStage : public StageWorker<AudioChunk, RecognitionResult> {
public:
  RecognitionStage(std::shared_ptr<Recognizer> recognizer,
                   std::shared_ptr<InputQueue> input, const Logger &log)
      : StageWorker("recognition", std::move(input), log),
        recognizer_(std::move(recognizer)) {}

  uint64_t get_partials() const { return partials_; }
  uint64_t get_finals() const { return finals_; }

protected:
  StageResult process(AudioChunk &chunk, const Sink &sink) override;

private:
  void abandon_segment();

  std::shared_ptr<Recognizer> recognizer_;
  uint64_t segment_id_{0};
  uint32_t token_index_{0};
  std::atomic<uint64_t> partials_{0};
  std::atomic<uint64_t> finals_{0};
};

#endif
