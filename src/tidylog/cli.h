#pragma once

#include "tidy/LoggerOptions.h"
#include "tidy/logging/Registry.h"

#include <argparse/argparse.hpp>

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace tidy::tidylog {
    argparse::ArgumentParser createArgumentParser();

    // Config file values first, then every option given on the command line.
    LoggerOptions createOptions(const argparse::ArgumentParser& argumentParser);

    // Positional messages, or the lines of input when there are none.
    std::vector<std::string> collectMessages(const argparse::ArgumentParser& argumentParser, std::istream& input);

    // arguments[0] is the program name. Returns EXIT_SUCCESS or EXIT_FAILURE, errors go to errors.
    int run(
        const std::vector<std::string>& arguments,
        std::istream& input,
        std::ostream& errors,
        logging::Registry& registry = logging::Registry::global()
    );
}
