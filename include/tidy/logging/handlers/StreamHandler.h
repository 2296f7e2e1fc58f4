#pragma once

#include "tidy/logging/Handler.h"
#include <iostream>

namespace tidy::logging::handlers {
    class StreamHandler : public Handler {
    public:
        StreamHandler(Level level, std::ostream& os, Formatter formatter = defaultFormatter) :
            Handler(level, std::move(formatter)), _stream(os) {
        }

        StreamHandler(Level level = Level::Warning, Formatter formatter = defaultFormatter) :
            Handler(level, std::move(formatter)), _stream(std::cerr) {
        }

    protected:
        void emit(const Record& record) override {
            _stream << format(record) << std::endl;
        }

        void doFlush() override {
            _stream.flush();
        }

        // The stream is borrowed, so closing only flushes it.
        void doClose() override {
            _stream.flush();
        }

    private:
        std::ostream& _stream;
    };
}
