// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <chrono>
#include <string>

namespace hikari::time {

using Clock = std::chrono::steady_clock;

/// Wall clock style "HH:MM:SS.mmm" for a steady clock time point
std::string format_timestamp(const Clock::time_point& tp);

/// Measures elapsed time since construction or the last reset
class Stopwatch {
public:
    Stopwatch();

    void reset();
    double elapsed_seconds() const;
    double elapsed_milliseconds() const;

private:
    Clock::time_point m_start;
};

/// Logs "<label> took N ms" when it goes out of scope
class ScopedTimer {
public:
    explicit ScopedTimer(std::string label);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string m_label;
    Stopwatch m_watch;
};

} // namespace hikari::time
