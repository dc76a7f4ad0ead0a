//
//  utils.hpp
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

#ifndef _UTILS_HPP_
#define _UTILS_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "log.hpp"

class TimeElapsed {
public:
  TimeElapsed() = delete;
  TimeElapsed(Logger &log, const std::string &desc) : log_(log), desc_(desc) {
    start_ = std::chrono::steady_clock::now();
  }

  uint32_t elapsed() const {
    auto end = std::chrono::steady_clock::now();
    std::chrono::duration<double, std::milli> elapsed = end - start_;
    return elapsed.count();
  }

  ~TimeElapsed() {
    BOOST_LOG_SEV(log_, boost::log::trivial::debug)
        << desc_ << " returned in " << elapsed() << " ms";
  }

private:
  Logger &log_;
  std::chrono::steady_clock::time_point start_;
  std::string desc_;
};

/* number of trailing bytes of a truncated UTF-8 sequence at the end of s */
inline size_t utf8_incomplete_tail(const std::string &s) {
  size_t n = s.size();
  for (size_t back = 1; back <= 4 && back <= n; back++) {
    auto c = static_cast<unsigned char>(s[n - back]);
    if ((c & 0xC0) == 0x80)
      continue; // continuation byte
    size_t len = 1;
    if ((c & 0xE0) == 0xC0)
      len = 2;
    else if ((c & 0xF0) == 0xE0)
      len = 3;
    else if ((c & 0xF8) == 0xF0)
      len = 4;
    return len > back ? back : 0;
  }
  return 0;
}

/* keep at most max_chars code points, never splitting a sequence */
inline std::string utf8_truncate(const std::string &s, size_t max_chars) {
  size_t chars = 0;
  for (size_t i = 0; i < s.size(); i++) {
    if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
      if (chars == max_chars)
        return s.substr(0, i);
      chars++;
    }
  }
  return s;
}

inline size_t utf8_length(const std::string &s) {
  size_t chars = 0;
  for (auto c : s) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80)
      chars++;
  }
  return chars;
}

#endif
