#pragma once

#include "tidy/logging/Level.h"
#include <string>
#include <chrono>
#include <utility>

namespace tidy::logging {
    using TimePoint = std::chrono::time_point<std::chrono::system_clock>;

    class Record {
    public:
        Record(std::string loggerName, Level recordLevel, std::string recordMessage, TimePoint recordTime = std::chrono::system_clock::now()) :
            name(std::move(loggerName)), level(recordLevel), time(recordTime), message(std::move(recordMessage)) {
        }

        std::string name;
        Level level;
        TimePoint time;
        std::string message;

        const std::string& getLevelName() const {
            return toLevelName(level);
        }
    };
}
