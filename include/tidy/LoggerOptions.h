#pragma once

#include "tidy/tidy-config.h"
#include "tidy/logging/Level.h"
#include "tidy/logging/handlers/FileHandler.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

namespace tidy {
    enum class ConsoleTarget {
        Stderr,
        Stdout,
    };

    enum class ColorMode {
        Auto,
        Always,
        Never,
    };

    struct LoggerOptions {
        std::optional<std::filesystem::path> fileName;
        logging::handlers::FileMode fileMode = logging::handlers::FileMode::Append;
        logging::Level consoleLevel = logging::Level::Info;
        logging::Level fileLevel = logging::Level::Debug;
        std::optional<std::string> name;
        bool addDateSuffix = true;
        bool useRotation = false;
        std::size_t maxBytes = DEFAULT_MAX_BYTES;
        uint32_t backupCount = DEFAULT_BACKUP_COUNT;
        ConsoleTarget console = ConsoleTarget::Stderr;
        ColorMode color = ColorMode::Auto;
        // Replaces the console target when set. Not owned: the console handler keeps a reference to it
        // until close() detaches the handlers, so the stream must outlive the named logger's handler set,
        // not only the TidyLogger that was constructed with it.
        std::ostream* consoleStream = nullptr;
    };

    logging::handlers::FileMode parseFileMode(const std::string& mode);
    ConsoleTarget parseConsoleTarget(const std::string& target);
    ColorMode parseColorMode(const std::string& mode);

    // Keys not present keep their defaults. Wrongly typed values throw InvalidTypeError.
    LoggerOptions loadOptions(const nlohmann::json& config, LoggerOptions options = LoggerOptions());
    LoggerOptions loadOptionsFile(const std::filesystem::path& configPath, LoggerOptions options = LoggerOptions());
}
