#include "tidy/logging/Formatter.h"
#include "fmt/format.h"
#include "fmt/chrono.h"
#include "fmt/color.h"

#include <chrono>
#include <ctime>

namespace tidy::logging::formatters {
    static constexpr std::size_t LEVEL_NAME_WIDTH = 8;

    static std::string makeTimeString(const TimePoint& time) {
        std::time_t timeObj = std::chrono::system_clock::to_time_t(time);
        auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
            time.time_since_epoch()
        ).count() % 1000;

        return fmt::format("{:%Y-%m-%d %H:%M:%S},{:03}", fmt::localtime(timeObj), milliseconds);
    }

    static fmt::text_style levelStyle(Level level) {
        switch (level) {
            case Level::Critical:
                return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
            case Level::Error:
                return fmt::fg(fmt::terminal_color::red);
            case Level::Warning:
                return fmt::fg(fmt::terminal_color::yellow);
            case Level::Info:
                return fmt::fg(fmt::terminal_color::green);
            case Level::Debug:
                return fmt::fg(fmt::terminal_color::cyan);
            case Level::Trace:
                return fmt::fg(fmt::terminal_color::bright_black);
        }

        return fmt::text_style();
    }

    std::string indentContinuationLines(const std::string& message, std::size_t width) {
        std::string indented;
        indented.reserve(message.size());

        const std::string indentation(width, ' ');
        for (std::size_t charIndex = 0; charIndex != message.size(); ++charIndex) {
            indented.push_back(message[charIndex]);

            if (message[charIndex] == '\n' && charIndex + 1 != message.size()) {
                indented.append(indentation);
            }
        }

        return indented;
    }

    namespace indented {
        std::string formatRecord(const Record& record) {
            std::string prefix = fmt::format("{} | {:<{}} | {} | ",
                makeTimeString(record.time),
                record.getLevelName(), LEVEL_NAME_WIDTH,
                record.name
            );

            return prefix + indentContinuationLines(record.message, prefix.size());
        }
    }

    namespace colored {
        std::string formatRecord(const Record& record) {
            std::string timeString = makeTimeString(record.time);
            std::string paddedLevelName = fmt::format("{:<{}}", record.getLevelName(), LEVEL_NAME_WIDTH);

            // Escape sequences take no columns, so measure the uncolored prefix.
            std::size_t prefixWidth = fmt::formatted_size("{} | {} | {} | ", timeString, paddedLevelName, record.name);

            std::string prefix = fmt::format("{} | {} | {} | ",
                timeString,
                fmt::format(levelStyle(record.level), "{}", paddedLevelName),
                record.name
            );

            return prefix + indentContinuationLines(record.message, prefixWidth);
        }
    }
}
