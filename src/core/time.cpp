// hikari - CPU path tracer
// Copyright (c) 2025 hikari Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hikari/core/time.h"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

#include "hikari/core/log.h"

namespace hikari::time
{

using namespace std::chrono;

std::string format_timestamp(const Clock::time_point& tp)
{
    // Shift the steady time point onto the system clock for formatting
    const auto now_steady = Clock::now();
    const auto now_system = system_clock::now();
    const auto diff = duration_cast<system_clock::duration>(tp - now_steady);
    const auto system_tp = time_point_cast<system_clock::duration>(now_system + diff);

    const auto time = system_clock::to_time_t(system_tp);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S");
    const auto remainder = duration_cast<milliseconds>(system_tp.time_since_epoch()) % 1000;
    oss << '.' << std::setfill('0') << std::setw(3) << remainder.count();
    return oss.str();
}

Stopwatch::Stopwatch() : m_start(Clock::now()) {}

void Stopwatch::reset()
{
    m_start = Clock::now();
}

double Stopwatch::elapsed_seconds() const
{
    return duration_cast<duration<double>>(Clock::now() - m_start).count();
}

double Stopwatch::elapsed_milliseconds() const
{
    return duration_cast<duration<double, std::milli>>(Clock::now() - m_start).count();
}

ScopedTimer::ScopedTimer(std::string label) : m_label(std::move(label)) {}

ScopedTimer::~ScopedTimer()
{
    HIKARI_LOG_INFO("[timer] {} took {:.3f} ms", m_label, m_watch.elapsed_milliseconds());
}

} // namespace hikari::time
