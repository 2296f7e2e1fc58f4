#include "tidy/logging/Level.h"
#include "fmt/format.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace tidy::logging {
    const std::string& toLevelName(Level level)
    {
        static const std::vector<std::string> LevelNames{
            "CRITICAL",
            "ERROR",
            "WARNING",
            "INFO",
            "DEBUG",
            "TRACE",
        };

        return LevelNames.at(static_cast<int8_t>(level));
    }

    Level parseLevel(std::string_view levelName) {
        std::string upperName(levelName);
        std::transform(upperName.begin(), upperName.end(), upperName.begin(), [](unsigned char ch) {
            return static_cast<char>(std::toupper(ch));
        });

        if (upperName == "CRITICAL") {
            return Level::Critical;
        }
        else if (upperName == "ERROR") {
            return Level::Error;
        }
        else if (upperName == "WARNING" || upperName == "WARN") {
            return Level::Warning;
        }
        else if (upperName == "INFO") {
            return Level::Info;
        }
        else if (upperName == "DEBUG") {
            return Level::Debug;
        }
        else if (upperName == "TRACE") {
            return Level::Trace;
        }

        throw std::invalid_argument(fmt::format("Unknown log level: {}", levelName));
    }

    Level levelFromNumeric(int value) {
        if (value >= 50) {
            return Level::Critical;
        }
        else if (value >= 40) {
            return Level::Error;
        }
        else if (value >= 30) {
            return Level::Warning;
        }
        else if (value >= 20) {
            return Level::Info;
        }
        else if (value >= 10) {
            return Level::Debug;
        }

        return Level::Trace;
    }
}
