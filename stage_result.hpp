//
//  stage_result.hpp
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

#ifndef _STAGE_RESULT_HPP_
#define _STAGE_RESULT_HPP_

#include <string>
#include <utility>

/*
 * Outcome of processing one item in a stage.
 * transient: log, skip the item, keep going.
 * fatal: the stage cannot continue and the pipeline is faulted.
 */
class StageResult {
public:
  enum class Status { ok, transient, fatal };

  static StageResult ok() { return StageResult(Status::ok, {}); }
  static StageResult transient(std::string message) {
    return StageResult(Status::transient, std::move(message));
  }
  static StageResult fatal(std::string message) {
    return StageResult(Status::fatal, std::move(message));
  }

  Status get_status() const { return status_; }
  const std::string &get_message() const { return message_; }
  bool is_ok() const { return status_ == Status::ok; }
  bool is_fatal() const { return status_ == Status::fatal; }

private:
  StageResult(Status status, std::string message)
      : status_(status), message_(std::move(message)) {}

  Status status_;
  std::string message_;
};

#endif
