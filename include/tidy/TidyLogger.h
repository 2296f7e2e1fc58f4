#pragma once

#include "tidy/LoggerOptions.h"
#include "tidy/logging/Logger.h"
#include "tidy/logging/Registry.h"
#include "fmt/format.h"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tidy {
    // Named logger writing to a console stream and to a (rotating) log file.
    //
    // Loggers are shared by name through the registry. Constructing a second TidyLogger
    // with a name whose logger already has handlers reuses them instead of attaching
    // new ones, so repeated construction never duplicates output. close() detaches the
    // handlers and allows the name to be configured again.
    class TidyLogger {
    public:
        explicit TidyLogger(
            const LoggerOptions& options = LoggerOptions(),
            logging::Registry& registry = logging::Registry::global()
        );

        TidyLogger(const TidyLogger&) = delete;
        TidyLogger& operator=(const TidyLogger&) = delete;

        const std::string& getName() const {
            return _logger->getName();
        }

        logging::Logger& getLogger() {
            return *_logger;
        }

        // Set only when this instance attached the handlers.
        const std::optional<std::filesystem::path>& getFilePath() const {
            return _filePath;
        }

        const std::vector<logging::HandlerCloseResult>& getLastCloseResults() const {
            return _lastCloseResults;
        }

        void log(logging::Level level, const std::string& message) {
            _logger->log(level, message);
        }

        template <typename Arg, typename... Args>
        void log(logging::Level level, fmt::format_string<Arg, Args...> format, Arg&& arg, Args&&... args) {
            _logger->log(level, format, std::forward<Arg>(arg), std::forward<Args>(args)...);
        }

        void trace(const std::string& message) {
            log(logging::Level::Trace, message);
        }

        void debug(const std::string& message) {
            log(logging::Level::Debug, message);
        }

        void info(const std::string& message) {
            log(logging::Level::Info, message);
        }

        void warning(const std::string& message) {
            log(logging::Level::Warning, message);
        }

        void error(const std::string& message) {
            log(logging::Level::Error, message);
        }

        void critical(const std::string& message) {
            log(logging::Level::Critical, message);
        }

        template <typename Arg, typename... Args>
        void trace(fmt::format_string<Arg, Args...> format, Arg&& arg, Args&&... args) {
            log(logging::Level::Trace, format, std::forward<Arg>(arg), std::forward<Args>(args)...);
        }

        template <typename Arg, typename... Args>
        void debug(fmt::format_string<Arg, Args...> format, Arg&& arg, Args&&... args) {
            log(logging::Level::Debug, format, std::forward<Arg>(arg), std::forward<Args>(args)...);
        }

        template <typename Arg, typename... Args>
        void info(fmt::format_string<Arg, Args...> format, Arg&& arg, Args&&... args) {
            log(logging::Level::Info, format, std::forward<Arg>(arg), std::forward<Args>(args)...);
        }

        template <typename Arg, typename... Args>
        void warning(fmt::format_string<Arg, Args...> format, Arg&& arg, Args&&... args) {
            log(logging::Level::Warning, format, std::forward<Arg>(arg), std::forward<Args>(args)...);
        }

        template <typename Arg, typename... Args>
        void error(fmt::format_string<Arg, Args...> format, Arg&& arg, Args&&... args) {
            log(logging::Level::Error, format, std::forward<Arg>(arg), std::forward<Args>(args)...);
        }

        template <typename Arg, typename... Args>
        void critical(fmt::format_string<Arg, Args...> format, Arg&& arg, Args&&... args) {
            log(logging::Level::Critical, format, std::forward<Arg>(arg), std::forward<Args>(args)...);
        }

        // Flushes, closes and detaches every handler of the logger. Never throws.
        void close();

    private:
        std::vector<logging::HandlerPtr> createHandlers(const LoggerOptions& options);

        logging::Registry& _registry;
        logging::LoggerPtr _logger;
        std::optional<std::filesystem::path> _filePath;
        std::vector<logging::HandlerCloseResult> _lastCloseResults;
    };
}
