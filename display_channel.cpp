//
//  display_channel.cpp
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

#include "display_channel.hpp"

void DisplayChannel::post(DisplayEvent event) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (event.type == DisplayEvent::Type::partial && !events_.empty() &&
      events_.back().type == DisplayEvent::Type::partial) {
    events_.back() = std::move(event);
    coalesced_++;
    return;
  }
  events_.push_back(std::move(event));
}

std::vector<DisplayEvent> DisplayChannel::pop_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DisplayEvent> out;
  out.swap(events_);
  return out;
}

size_t DisplayChannel::get_coalesced() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return coalesced_;
}
