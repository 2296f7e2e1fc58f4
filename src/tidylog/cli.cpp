#include "tidylog/cli.h"
#include "tidy/TidyLogger.h"
#include "tidy/errors.h"
#include "tidy/utils/io_utils.h"

#include "fmt/format.h"

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <optional>

namespace tidy::tidylog {
    argparse::ArgumentParser createArgumentParser() {
        argparse::ArgumentParser program("tidylog");

        program.add_argument("--config")
            .help("JSON file with logger options");

        program.add_argument("--file")
            .help("Log file name");

        program.add_argument("--name")
            .help("Logger name");

        program.add_argument("--level")
            .help("Level of the logged messages")
            .default_value(std::string("INFO"));

        program.add_argument("--console-level")
            .help("Minimum level written to the console");

        program.add_argument("--file-level")
            .help("Minimum level written to the log file");

        program.add_argument("--no-date-suffix")
            .help("Don't append the current date to the log file name")
            .default_value(false)
            .implicit_value(true);

        program.add_argument("--overwrite")
            .help("Truncate the log file instead of appending")
            .default_value(false)
            .implicit_value(true);

        program.add_argument("--rotate")
            .help("Rotate the log file by size")
            .default_value(false)
            .implicit_value(true);

        program.add_argument("--max-bytes")
            .help("Size in bytes that triggers a rotation")
            .scan<'d', uint64_t>();

        program.add_argument("--backup-count")
            .help("Number of rotated files to keep")
            .scan<'d', uint32_t>();

        program.add_argument("messages")
            .help("Messages to log, read from stdin when omitted")
            .remaining();

        return program;
    }

    LoggerOptions createOptions(const argparse::ArgumentParser& argumentParser) {
        LoggerOptions options;

        if (auto configPath = argumentParser.present("--config")) {
            options = loadOptionsFile(*configPath);
        }

        if (auto fileName = argumentParser.present("--file")) {
            options.fileName = *fileName;
        }
        if (auto name = argumentParser.present("--name")) {
            options.name = *name;
        }
        if (auto consoleLevel = argumentParser.present("--console-level")) {
            options.consoleLevel = logging::parseLevel(*consoleLevel);
        }
        if (auto fileLevel = argumentParser.present("--file-level")) {
            options.fileLevel = logging::parseLevel(*fileLevel);
        }
        if (argumentParser.get<bool>("--no-date-suffix")) {
            options.addDateSuffix = false;
        }
        if (argumentParser.get<bool>("--overwrite")) {
            options.fileMode = logging::handlers::FileMode::Overwrite;
        }
        if (argumentParser.get<bool>("--rotate")) {
            options.useRotation = true;
        }
        if (auto maxBytes = argumentParser.present<uint64_t>("--max-bytes")) {
            options.maxBytes = static_cast<std::size_t>(*maxBytes);
        }
        if (auto backupCount = argumentParser.present<uint32_t>("--backup-count")) {
            options.backupCount = *backupCount;
        }

        return options;
    }

    std::vector<std::string> collectMessages(const argparse::ArgumentParser& argumentParser, std::istream& input) {
        if (auto messages = argumentParser.present<std::vector<std::string>>("messages")) {
            if (!messages->empty()) {
                return *messages;
            }
        }

        return utils::readLines(input);
    }

    int run(
        const std::vector<std::string>& arguments,
        std::istream& input,
        std::ostream& errors,
        logging::Registry& registry
    ) {
        auto argumentParser = createArgumentParser();

        try {
            argumentParser.parse_args(arguments);
        }
        catch (const std::exception& e) {
            errors << e.what() << std::endl;
            errors << argumentParser;

            return EXIT_FAILURE;
        }

        try {
            LoggerOptions options = createOptions(argumentParser);
            logging::Level messageLevel = logging::parseLevel(argumentParser.get("--level"));

            TidyLogger logger(options, registry);
            for (const auto& message : collectMessages(argumentParser, input)) {
                logger.log(messageLevel, message);
            }
            logger.close();
        }
        catch (const InvalidNameError& e) {
            errors << fmt::format("Invalid log file name: {}", e.what()) << std::endl;

            return EXIT_FAILURE;
        }
        catch (const std::exception& e) {
            errors << fmt::format("tidylog: {}", e.what()) << std::endl;

            return EXIT_FAILURE;
        }

        return EXIT_SUCCESS;
    }
}
