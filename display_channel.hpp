//
//  display_channel.hpp
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

#ifndef _DISPLAY_CHANNEL_HPP_
#define _DISPLAY_CHANNEL_HPP_

#include <mutex>
#include <string>
#include <utility>
#include <vector>

struct DisplayEvent {
  enum class Type { partial, translation };

  Type type{Type::partial};
  std::string text; // partial text, or the original of a translation
  std::string translation;
  std::string context;

  static DisplayEvent partial(std::string text) {
    DisplayEvent event;
    event.type = Type::partial;
    event.text = std::move(text);
    return event;
  }
  static DisplayEvent translated(std::string original, std::string translation,
                                 std::string context) {
    DisplayEvent event;
    event.type = Type::translation;
    event.text = std::move(original);
    event.translation = std::move(translation);
    event.context = std::move(context);
    return event;
  }
};

/*
 * Hand-off from pipeline threads to the thread that owns the display.
 * Producers post, the display loop drains with pop_all().
 * A partial replaces a partial still waiting at the tail.
 */
class DisplayChannel {
public:
  void post(DisplayEvent event);
  std::vector<DisplayEvent> pop_all();
  size_t get_coalesced() const;

private:
  mutable std::mutex mutex_;
  std::vector<DisplayEvent> events_;
  size_t coalesced_{0};
};

#endif
