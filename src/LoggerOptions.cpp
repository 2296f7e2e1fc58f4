#include "tidy/LoggerOptions.h"
#include "tidy/errors.h"
#include "tidy/utils/io_utils.h"
#include "fmt/format.h"

#include <algorithm>
#include <cctype>
#include <limits>
#include <set>
#include <stdexcept>

using json = nlohmann::json;

namespace tidy {
    static const std::set<std::string> KnownKeys{
        "fileName",
        "fileMode",
        "consoleLevel",
        "fileLevel",
        "name",
        "addDateSuffix",
        "useRotation",
        "maxBytes",
        "backupCount",
        "console",
        "color",
    };

    static std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });

        return value;
    }

    static InvalidTypeError makeTypeError(const std::string& key, const char* expected, const json& value) {
        return InvalidTypeError(fmt::format("Option '{}' should be {}, got {}", key, expected, value.type_name()));
    }

    static std::string getString(const json& config, const std::string& key) {
        const auto& value = config.at(key);
        if (!value.is_string()) {
            throw makeTypeError(key, "a string", value);
        }

        return value.get<std::string>();
    }

    static std::optional<std::string> getOptionalString(const json& config, const std::string& key) {
        const auto& value = config.at(key);
        if (value.is_null()) {
            return std::nullopt;
        }
        if (!value.is_string()) {
            throw makeTypeError(key, "a string or null", value);
        }

        return value.get<std::string>();
    }

    static bool getBool(const json& config, const std::string& key) {
        const auto& value = config.at(key);
        if (!value.is_boolean()) {
            throw makeTypeError(key, "a boolean", value);
        }

        return value.get<bool>();
    }

    static uint64_t getUnsigned(const json& config, const std::string& key) {
        const auto& value = config.at(key);
        if (!value.is_number_integer()) {
            throw makeTypeError(key, "an integer", value);
        }
        if (value.is_number_unsigned()) {
            return value.get<uint64_t>();
        }

        int64_t signedValue = value.get<int64_t>();
        if (signedValue < 0) {
            throw std::invalid_argument(fmt::format("Option '{}' can't be negative: {}", key, signedValue));
        }

        return static_cast<uint64_t>(signedValue);
    }

    static logging::Level getLevel(const json& config, const std::string& key) {
        const auto& value = config.at(key);
        if (value.is_string()) {
            return logging::parseLevel(value.get<std::string>());
        }
        if (value.is_number_integer()) {
            return logging::levelFromNumeric(value.get<int>());
        }

        throw makeTypeError(key, "a level name or number", value);
    }

    logging::handlers::FileMode parseFileMode(const std::string& mode) {
        const std::string lowerMode = toLower(mode);

        if (lowerMode == "append" || lowerMode == "a") {
            return logging::handlers::FileMode::Append;
        }
        else if (lowerMode == "overwrite" || lowerMode == "w") {
            return logging::handlers::FileMode::Overwrite;
        }

        throw std::invalid_argument(fmt::format("Unknown file mode: {}", mode));
    }

    ConsoleTarget parseConsoleTarget(const std::string& target) {
        const std::string lowerTarget = toLower(target);

        if (lowerTarget == "stderr") {
            return ConsoleTarget::Stderr;
        }
        else if (lowerTarget == "stdout") {
            return ConsoleTarget::Stdout;
        }

        throw std::invalid_argument(fmt::format("Unknown console target: {}", target));
    }

    ColorMode parseColorMode(const std::string& mode) {
        const std::string lowerMode = toLower(mode);

        if (lowerMode == "auto") {
            return ColorMode::Auto;
        }
        else if (lowerMode == "always") {
            return ColorMode::Always;
        }
        else if (lowerMode == "never") {
            return ColorMode::Never;
        }

        throw std::invalid_argument(fmt::format("Unknown color mode: {}", mode));
    }

    LoggerOptions loadOptions(const json& config, LoggerOptions options) {
        if (!config.is_object()) {
            throw InvalidTypeError(fmt::format("Logger configuration should be an object, got {}", config.type_name()));
        }

        for (const auto& item : config.items()) {
            if (KnownKeys.count(item.key()) == 0) {
                throw std::invalid_argument(fmt::format("Unknown logger option: {}", item.key()));
            }
        }

        if (config.contains("fileName")) {
            const auto& fileName = config.at("fileName");
            if (fileName.is_null()) {
                options.fileName.reset();
            }
            else if (fileName.is_string()) {
                options.fileName = std::filesystem::path(fileName.get<std::string>());
            }
            else {
                throw InvalidTypeError(fmt::format(
                    "Option 'fileName' should be a string or null, got {}", fileName.type_name()
                ));
            }
        }

        if (config.contains("fileMode")) {
            options.fileMode = parseFileMode(getString(config, "fileMode"));
        }
        if (config.contains("consoleLevel")) {
            options.consoleLevel = getLevel(config, "consoleLevel");
        }
        if (config.contains("fileLevel")) {
            options.fileLevel = getLevel(config, "fileLevel");
        }
        if (config.contains("name")) {
            options.name = getOptionalString(config, "name");
        }
        if (config.contains("addDateSuffix")) {
            options.addDateSuffix = getBool(config, "addDateSuffix");
        }
        if (config.contains("useRotation")) {
            options.useRotation = getBool(config, "useRotation");
        }
        if (config.contains("maxBytes")) {
            options.maxBytes = static_cast<std::size_t>(getUnsigned(config, "maxBytes"));
        }
        if (config.contains("backupCount")) {
            uint64_t backupCount = getUnsigned(config, "backupCount");
            if (backupCount > std::numeric_limits<uint32_t>::max()) {
                throw std::invalid_argument(fmt::format("Option 'backupCount' is too large: {}", backupCount));
            }
            options.backupCount = static_cast<uint32_t>(backupCount);
        }
        if (config.contains("console")) {
            options.console = parseConsoleTarget(getString(config, "console"));
        }
        if (config.contains("color")) {
            options.color = parseColorMode(getString(config, "color"));
        }

        return options;
    }

    LoggerOptions loadOptionsFile(const std::filesystem::path& configPath, LoggerOptions options) {
        const std::string content = utils::readFile(configPath);

        json config;
        try {
            config = json::parse(content);
        }
        catch (const json::parse_error& e) {
            throw std::runtime_error(fmt::format("Can't parse logger configuration {}: {}", configPath.string(), e.what()));
        }

        return loadOptions(config, std::move(options));
    }
}
