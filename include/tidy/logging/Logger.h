#pragma once

#include "tidy/logging/Level.h"
#include "tidy/logging/Handler.h"
#include "tidy/logging/Record.h"
#include "fmt/format.h"

#include <atomic>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace tidy::logging {
    struct HandlerCloseResult {
        HandlerPtr handler;
        bool flushed = false;
        bool closed = false;
        std::string error;

        bool succeeded() const {
            return flushed && closed;
        }
    };

    class Logger {
    public:
        explicit Logger(const std::string& name, Level level = Level::Warning) :
            _name(name), _level(level) {
        }

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        const std::string& getName() const {
            return _name;
        }

        Level getLevel() const {
            return _level.load();
        }

        void setLevel(Level level) {
            _level.store(level);
        }

        bool isEnabledFor(Level level) const {
            return isAtLeast(level, getLevel());
        }

        void addHandler(HandlerPtr handler);
        bool removeHandler(const HandlerPtr& handler);
        std::vector<HandlerPtr> getHandlers() const;
        bool hasHandlers() const;

        // Flushes, closes and detaches every handler. Failures are reported per handler.
        std::vector<HandlerCloseResult> closeHandlers();

        Logger& log(Level level, const std::string& message);

        template <typename Arg, typename... Args>
        Logger& log(Level level, fmt::format_string<Arg, Args...> format, Arg&& arg, Args&&... args) {
            if (!isEnabledFor(level)) {
                return *this;
            }

            return dispatch(level, fmt::format(format, std::forward<Arg>(arg), std::forward<Args>(args)...));
        }

        Logger& critical(const std::string& message) {
            return log(Level::Critical, message);
        }

        Logger& error(const std::string& message) {
            return log(Level::Error, message);
        }

        Logger& warning(const std::string& message) {
            return log(Level::Warning, message);
        }

        Logger& info(const std::string& message) {
            return log(Level::Info, message);
        }

        Logger& debug(const std::string& message) {
            return log(Level::Debug, message);
        }

        Logger& trace(const std::string& message) {
            return log(Level::Trace, message);
        }

        template <typename Arg, typename... Args>
        Logger& critical(fmt::format_string<Arg, Args...> format, Arg&& arg, Args&&... args) {
            return log(Level::Critical, format, std::forward<Arg>(arg), std::forward<Args>(args)...);
        }

        template <typename Arg, typename... Args>
        Logger& error(fmt::format_string<Arg, Args...> format, Arg&& arg, Args&&... args) {
            return log(Level::Error, format, std::forward<Arg>(arg), std::forward<Args>(args)...);
        }

        template <typename Arg, typename... Args>
        Logger& warning(fmt::format_string<Arg, Args...> format, Arg&& arg, Args&&... args) {
            return log(Level::Warning, format, std::forward<Arg>(arg), std::forward<Args>(args)...);
        }

        template <typename Arg, typename... Args>
        Logger& info(fmt::format_string<Arg, Args...> format, Arg&& arg, Args&&... args) {
            return log(Level::Info, format, std::forward<Arg>(arg), std::forward<Args>(args)...);
        }

        template <typename Arg, typename... Args>
        Logger& debug(fmt::format_string<Arg, Args...> format, Arg&& arg, Args&&... args) {
            return log(Level::Debug, format, std::forward<Arg>(arg), std::forward<Args>(args)...);
        }

        template <typename Arg, typename... Args>
        Logger& trace(fmt::format_string<Arg, Args...> format, Arg&& arg, Args&&... args) {
            return log(Level::Trace, format, std::forward<Arg>(arg), std::forward<Args>(args)...);
        }

    private:
        Logger& dispatch(Level level, std::string message);

        std::string _name;
        std::atomic<Level> _level;
        mutable std::mutex _handlersMutex;
        std::vector<HandlerPtr> _handlers;
    };
}
