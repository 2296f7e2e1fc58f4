#pragma once

#include "tidy/logging/Formatter.h"
#include "tidy/logging/Level.h"
#include "tidy/logging/Record.h"
#include <string>
#include <memory>
#include <mutex>
#include <concepts>
#include <utility>

namespace tidy::logging {
    class Handler {
    public:
        Handler(Level level, Formatter formatter) : _level(level), _formatter(std::move(formatter)) {}

        Handler(const Handler&) = delete;
        Handler& operator=(const Handler&) = delete;

        virtual ~Handler() {}

        Level getLevel() const {
            std::lock_guard<std::mutex> lock(_mutex);
            return _level;
        }

        void setLevel(Level level) {
            std::lock_guard<std::mutex> lock(_mutex);
            _level = level;
        }

        void handle(const Record& record) {
            std::lock_guard<std::mutex> lock(_mutex);
            if (!isAtLeast(record.level, _level)) {
                return;
            }

            emit(record);
        }

        void flush() {
            std::lock_guard<std::mutex> lock(_mutex);
            doFlush();
        }

        void close() {
            std::lock_guard<std::mutex> lock(_mutex);
            doClose();
        }

    protected:
        // Called with the handler lock held.
        std::string format(const Record& record) const {
            return _formatter(record);
        }

        virtual void emit(const Record& record) = 0;
        virtual void doFlush() {}
        virtual void doClose() {}

    private:
        mutable std::mutex _mutex;
        Level _level;
        Formatter _formatter;
    };

    using HandlerPtr = std::shared_ptr<Handler>;

    template <class HandlerType>
    concept HandlerImplementation = std::derived_from<HandlerType, Handler> && !std::copy_constructible<HandlerType>;

    template <HandlerImplementation HandlerType, class... Args>
    std::shared_ptr<HandlerType> createHandler(Args&&... args) {
        return std::make_shared<HandlerType>(std::forward<Args>(args)...);
    }
}
