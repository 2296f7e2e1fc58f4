#pragma once

#include <iostream>
#include <cstdint>
#include <string>
#include <string_view>

namespace tidy::logging {
    enum class Level : int8_t {
        Critical = 0,
        Error = 1,
        Warning = 2,
        Info = 3,
        Debug = 4,
        Trace = 5,
    };

    const std::string& toLevelName(Level level);

    // Accepts CRITICAL, ERROR, WARNING (or WARN), INFO, DEBUG and TRACE in any case.
    Level parseLevel(std::string_view levelName);

    // Maps the classic numeric scale (10 debug .. 50 critical) onto Level.
    Level levelFromNumeric(int value);

    inline bool isAtLeast(Level level, Level threshold) {
        return level <= threshold;
    }

    inline Level mostVerbose(Level lhs, Level rhs) {
        return lhs > rhs ? lhs : rhs;
    }

    inline std::ostream& operator<<(std::ostream& os, Level level)
    {
        os << toLevelName(level);

        return os;
    }
}
