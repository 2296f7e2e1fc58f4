#pragma once

#include <stdexcept>
#include <string>

namespace tidy {
    class InvalidNameError : public std::invalid_argument {
    public:
        explicit InvalidNameError(const std::string& message) : std::invalid_argument(message) {}
    };

    class InvalidTypeError : public std::invalid_argument {
    public:
        explicit InvalidTypeError(const std::string& message) : std::invalid_argument(message) {}
    };
}
