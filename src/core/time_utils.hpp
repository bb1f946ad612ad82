#pragma once

#include <string>
#include <chrono>
#include "types.hpp"

// Human-readable compact duration like "2h35m", "14m22s", "8s".
// Negative durations are shown as "0s".
std::string format_duration(std::chrono::seconds d);

// Clock-style duration "HH:MM:SS"; hours grow past 99 if needed.
std::string format_clock(std::chrono::seconds d);

// Whole seconds from start to end, never negative.
std::chrono::seconds elapsed_between(TimePoint start, TimePoint end);
