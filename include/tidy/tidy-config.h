#pragma once

#include <cstddef>
#include <cstdint>

namespace tidy {
    inline constexpr const char* DEFAULT_FILE_NAME = "log";
    inline constexpr const char* DEFAULT_FILE_EXTENSION = ".log";
    inline constexpr const char* DEFAULT_LOGGER_NAME = "TidyLogger";
    inline constexpr const char* DATE_SUFFIX_FORMAT = "{:%Y%m%d}";

    // 100MB
    inline constexpr std::size_t DEFAULT_MAX_BYTES = 100 * 1024 * 1024;
    inline constexpr uint32_t DEFAULT_BACKUP_COUNT = 10;
}
