/**
 * @file FrameTime.hpp
 * @brief Clock types used by the frame loop and every timed animation.
 */

#pragma once

#include <chrono>

using FrameClock = std::chrono::steady_clock;
using TimePoint  = FrameClock::time_point;

// Fractional milliseconds; frame deltas are rarely whole numbers.
using Millis = std::chrono::duration<double, std::milli>;
