#include "time_utils.hpp"
#include <fmt/format.h>

std::string format_duration(std::chrono::seconds d) {
    long long seconds = d.count() < 0 ? 0 : static_cast<long long>(d.count());
    long long hours = seconds / 3600;
    long long mins = (seconds % 3600) / 60;
    long long secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_clock(std::chrono::seconds d) {
    long long seconds = d.count() < 0 ? 0 : static_cast<long long>(d.count());
    return fmt::format("{:02}:{:02}:{:02}",
                       seconds / 3600, (seconds % 3600) / 60, seconds % 60);
}

std::chrono::seconds elapsed_between(TimePoint start, TimePoint end) {
    if (end <= start) {
        return std::chrono::seconds(0);
    }
    return std::chrono::duration_cast<std::chrono::seconds>(end - start);
}
