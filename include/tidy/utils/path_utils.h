#pragma once

#include "tidy/utils/NamePolicy.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace tidy::utils {
    struct LogFileSpec {
        std::optional<std::filesystem::path> requestedName;
        // Empty when the file lives in the current directory.
        std::filesystem::path parent;
        std::string stem;
        std::string extension;
        bool dateSuffixed = false;

        std::string getFileName() const {
            return stem + extension;
        }

        std::filesystem::path path() const {
            return parent.empty() ? std::filesystem::path(getFileName()) : parent / getFileName();
        }
    };

    // YYYYMMDD in local time.
    std::string makeDateToken(std::chrono::system_clock::time_point time = std::chrono::system_clock::now());

    // Collapses repeated separators and "." components. ".." is kept as written.
    std::filesystem::path normalizePath(const std::filesystem::path& filePath);

    LogFileSpec resolveLogFileSpec(
        const std::optional<std::filesystem::path>& fileName,
        bool addDateSuffix,
        const NamePolicy& policy,
        const std::string& dateToken
    );

    std::filesystem::path resolveLogFilePath(
        const std::optional<std::filesystem::path>& fileName,
        bool addDateSuffix = true
    );
}
