#pragma once

#include <string>

// Wall-clock time of day at which cached entries should expire.
struct TimeOfDay {
    int hour = 0;
    int minute = 0;
    int second = 0;

    std::string to_string() const {
        auto two = [](int v) { return (v < 10 ? "0" : "") + std::to_string(v); };
        return two(hour) + ":" + two(minute) + ":" + two(second);
    }
};
