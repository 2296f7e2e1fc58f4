#include "tidy/TidyLogger.h"
#include "tidy/logging/Formatter.h"
#include "tidy/logging/handlers/FileHandler.h"
#include "tidy/logging/handlers/RotatingFileHandler.h"
#include "tidy/logging/handlers/StreamHandler.h"
#include "tidy/utils/io_utils.h"
#include "tidy/utils/path_utils.h"

#include <iostream>

namespace fs = std::filesystem;

namespace tidy {
    using logging::Formatter;
    using logging::HandlerPtr;
    using logging::createHandler;
    using logging::handlers::FileHandler;
    using logging::handlers::RotatingFileHandler;
    using logging::handlers::StreamHandler;

    TidyLogger::TidyLogger(const LoggerOptions& options, logging::Registry& registry) : _registry(registry) {
        const std::string name = options.name.value_or(DEFAULT_LOGGER_NAME);

        _registry.configureOnce(name, [this, &options](logging::Logger&) {
            return createHandlers(options);
        });

        _logger = _registry.getLogger(name);
        _logger->setLevel(logging::mostVerbose(options.consoleLevel, options.fileLevel));
    }

    std::vector<HandlerPtr> TidyLogger::createHandlers(const LoggerOptions& options) {
        const utils::LogFileSpec fileSpec = utils::resolveLogFileSpec(
            options.fileName,
            options.addDateSuffix,
            utils::NamePolicy::forCurrentPlatform(),
            utils::makeDateToken()
        );
        const fs::path filePath = fileSpec.path();

        if (!fileSpec.parent.empty()) {
            fs::create_directories(fileSpec.parent);
        }

        const Formatter fileFormatter = logging::formatters::indented::formatRecord;
        HandlerPtr fileHandler;
        if (options.useRotation) {
            fileHandler = createHandler<RotatingFileHandler>(
                filePath, options.fileMode, options.maxBytes, options.backupCount, options.fileLevel, fileFormatter
            );
        }
        else {
            fileHandler = createHandler<FileHandler>(filePath, options.fileMode, options.fileLevel, fileFormatter);
        }

        std::ostream& consoleStream = options.consoleStream ? *options.consoleStream :
            (options.console == ConsoleTarget::Stdout ? std::cout : std::cerr);

        bool colorize = options.color == ColorMode::Always ||
            (options.color == ColorMode::Auto && !options.consoleStream && utils::isInteractive(consoleStream));
        const Formatter consoleFormatter = colorize ?
            Formatter(logging::formatters::colored::formatRecord) :
            Formatter(logging::formatters::indented::formatRecord);

        HandlerPtr consoleHandler = createHandler<StreamHandler>(options.consoleLevel, consoleStream, consoleFormatter);

        _filePath = filePath;

        return { fileHandler, consoleHandler };
    }

    void TidyLogger::close() {
        _lastCloseResults = _logger->closeHandlers();

        for (const auto& result : _lastCloseResults) {
            if (!result.succeeded()) {
                std::cerr << fmt::format("Failed to release a handler of logger {}: {}", getName(), result.error) << std::endl;
            }
        }
    }
}
