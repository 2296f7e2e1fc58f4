#pragma once

#include "tidy/logging/Logger.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tidy::logging {
    using LoggerPtr = std::shared_ptr<Logger>;

    // Maps logger names to loggers. Loggers live until they are removed or the registry is destroyed.
    class Registry {
    public:
        using Initializer = std::function<std::vector<HandlerPtr>(Logger& logger)>;

        Registry() = default;
        Registry(const Registry&) = delete;
        Registry& operator=(const Registry&) = delete;

        static Registry& global();

        LoggerPtr getLogger(const std::string& name);
        bool contains(const std::string& name) const;
        bool remove(const std::string& name);

        // Runs initializer and attaches the handlers it returns only when the named logger has none.
        // The check and the attach happen under the registry lock. If initializer throws, nothing is attached
        // and a logger created by this call is removed again.
        bool configureOnce(const std::string& name, const Initializer& initializer);

    private:
        LoggerPtr getLoggerLocked(const std::string& name);

        mutable std::mutex _mutex;
        std::map<std::string, LoggerPtr> _loggers;
    };
}
