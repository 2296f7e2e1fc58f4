#pragma once

#include "tidy/logging/Record.h"
#include "fmt/format.h"
#include <cstddef>
#include <functional>
#include <string>

namespace tidy::logging {
    using Formatter = std::function<std::string(const Record& record)>;

    inline std::string defaultFormatter(const Record& record) {
        return fmt::format("{}:{}:{}", record.getLevelName(), record.name, record.message);
    }

    namespace formatters {
        // Indents every line after the first by width spaces.
        std::string indentContinuationLines(const std::string& message, std::size_t width);
    }

    // "2024-01-02 10:11:12,345 | INFO     | name | message", continuation lines aligned under the message
    namespace formatters::indented {
        std::string formatRecord(const Record& record);
    }

    // Same layout with the level name colored for terminals
    namespace formatters::colored {
        std::string formatRecord(const Record& record);
    }
}
