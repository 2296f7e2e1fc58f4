#include "tidy/utils/path_utils.h"
#include "tidy/errors.h"
#include "tidy/tidy-config.h"
#include "fmt/format.h"
#include "fmt/chrono.h"

#include <algorithm>
#include <cctype>
#include <ctime>

namespace fs = std::filesystem;

namespace tidy::utils {
    static bool isBlank(const std::string& value) {
        return std::all_of(value.cbegin(), value.cend(), [](unsigned char ch) {
            return std::isspace(ch);
        });
    }

    static void validateCommon(const fs::path& fileName) {
        const std::string fileNameString = fileName.string();

        if (isBlank(fileNameString)) {
            throw InvalidNameError("File name cannot be empty");
        }

        if (fileNameString.find('\0') != std::string::npos) {
            throw InvalidNameError("File name contains null byte");
        }
    }

    std::string makeDateToken(std::chrono::system_clock::time_point time) {
        std::time_t timeObj = std::chrono::system_clock::to_time_t(time);

        return fmt::format(fmt::runtime(DATE_SUFFIX_FORMAT), fmt::localtime(timeObj));
    }

    fs::path normalizePath(const fs::path& filePath) {
        fs::path normalized = filePath.root_path();

        for (const auto& component : filePath.relative_path()) {
            if (component.empty() || component == ".") {
                continue;
            }

            normalized /= component;
        }

        if (normalized.empty()) {
            return fs::path(".");
        }

        return normalized;
    }

    LogFileSpec resolveLogFileSpec(
        const std::optional<fs::path>& fileName,
        bool addDateSuffix,
        const NamePolicy& policy,
        const std::string& dateToken
    ) {
        LogFileSpec spec{
            .requestedName = fileName,
            .dateSuffixed = addDateSuffix,
        };

        if (!fileName) {
            spec.stem = addDateSuffix ? fmt::format("{}_{}", DEFAULT_FILE_NAME, dateToken) : DEFAULT_FILE_NAME;
            spec.extension = DEFAULT_FILE_EXTENSION;

            return spec;
        }

        validateCommon(*fileName);

        fs::path normalized = normalizePath(*fileName);
        fs::path leafName = normalized.filename();
        if (leafName.empty() || leafName == "." || leafName == "..") {
            throw InvalidNameError(fmt::format("File name does not name a file: {}", fileName->string()));
        }

        policy.validate(normalized);

        spec.parent = normalized.parent_path();
        spec.stem = leafName.stem().string();
        spec.extension = leafName.extension().string();

        // "name." keeps its trailing dot in the stem
        if (spec.extension == ".") {
            spec.stem += spec.extension;
            spec.extension.clear();
        }

        if (addDateSuffix) {
            spec.stem = fmt::format("{}_{}", spec.stem, dateToken);
        }

        if (spec.extension.empty()) {
            spec.extension = DEFAULT_FILE_EXTENSION;
        }

        return spec;
    }

    fs::path resolveLogFilePath(const std::optional<fs::path>& fileName, bool addDateSuffix) {
        return resolveLogFileSpec(fileName, addDateSuffix, NamePolicy::forCurrentPlatform(), makeDateToken()).path();
    }
}
