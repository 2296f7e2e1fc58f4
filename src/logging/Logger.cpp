#include "tidy/logging/Logger.h"

#include <algorithm>
#include <exception>

namespace tidy::logging {
    void Logger::addHandler(HandlerPtr handler) {
        std::lock_guard<std::mutex> lock(_handlersMutex);

        if (std::find(_handlers.cbegin(), _handlers.cend(), handler) == _handlers.cend()) {
            _handlers.push_back(std::move(handler));
        }
    }

    bool Logger::removeHandler(const HandlerPtr& handler) {
        std::lock_guard<std::mutex> lock(_handlersMutex);

        auto handlerItem = std::find(_handlers.begin(), _handlers.end(), handler);
        if (handlerItem == _handlers.end()) {
            return false;
        }

        _handlers.erase(handlerItem);

        return true;
    }

    std::vector<HandlerPtr> Logger::getHandlers() const {
        std::lock_guard<std::mutex> lock(_handlersMutex);

        return _handlers;
    }

    bool Logger::hasHandlers() const {
        std::lock_guard<std::mutex> lock(_handlersMutex);

        return !_handlers.empty();
    }

    std::vector<HandlerCloseResult> Logger::closeHandlers() {
        std::vector<HandlerCloseResult> results;

        for (const auto& handler : getHandlers()) {
            HandlerCloseResult result{ .handler = handler };

            try {
                handler->flush();
                result.flushed = true;
            }
            catch (const std::exception& e) {
                result.error = e.what();
            }

            try {
                handler->close();
                result.closed = true;
            }
            catch (const std::exception& e) {
                if (!result.error.empty()) {
                    result.error += "; ";
                }
                result.error += e.what();
            }

            removeHandler(handler);
            results.push_back(std::move(result));
        }

        return results;
    }

    Logger& Logger::log(Level level, const std::string& message) {
        if (!isEnabledFor(level)) {
            return *this;
        }

        return dispatch(level, message);
    }

    Logger& Logger::dispatch(Level level, std::string message) {
        const Record record(_name, level, std::move(message));

        for (const auto& handler : getHandlers()) {
            handler->handle(record);
        }

        return *this;
    }
}
