#include "tidy/logging/Registry.h"

namespace tidy::logging {
    Registry& Registry::global() {
        static Registry registry;

        return registry;
    }

    LoggerPtr Registry::getLogger(const std::string& name) {
        std::lock_guard<std::mutex> lock(_mutex);

        return getLoggerLocked(name);
    }

    bool Registry::contains(const std::string& name) const {
        std::lock_guard<std::mutex> lock(_mutex);

        return _loggers.find(name) != _loggers.end();
    }

    bool Registry::remove(const std::string& name) {
        std::lock_guard<std::mutex> lock(_mutex);

        return _loggers.erase(name) > 0;
    }

    bool Registry::configureOnce(const std::string& name, const Initializer& initializer) {
        std::lock_guard<std::mutex> lock(_mutex);

        bool created = _loggers.find(name) == _loggers.end();
        LoggerPtr logger = getLoggerLocked(name);
        if (logger->hasHandlers()) {
            return false;
        }

        std::vector<HandlerPtr> handlers;
        try {
            handlers = initializer(*logger);
        }
        catch (...) {
            if (created) {
                _loggers.erase(name);
            }

            throw;
        }

        for (auto& handler : handlers) {
            logger->addHandler(std::move(handler));
        }

        return true;
    }

    LoggerPtr Registry::getLoggerLocked(const std::string& name) {
        auto loggerItem = _loggers.find(name);
        if (loggerItem != _loggers.end()) {
            return loggerItem->second;
        }

        auto logger = std::make_shared<Logger>(name);
        _loggers.emplace(name, logger);

        return logger;
    }
}
