#include "tidy/utils/io_utils.h"
#include "fmt/format.h"

#include <fstream>
#include <stdexcept>

#ifdef _WIN32
#include <io.h>
#include <stdio.h>
#else
#include <unistd.h>
#endif // _WIN32

namespace tidy::utils {
    std::string readFile(const std::filesystem::path& filePath)
    {
        std::ifstream is{ filePath, std::ios::binary | std::ios::ate };
        if (!is) {
            throw std::runtime_error(fmt::format("Can't open file {}", filePath.string()));
        }

        auto size = is.tellg();
        std::string str(static_cast<std::size_t>(size), '\0');
        is.seekg(0);
        if (!is.read(str.data(), size)) {
            throw std::runtime_error(fmt::format("Can't read file {}", filePath.string()));
        }

        return str;
    }

    std::vector<std::string> readLines(const std::filesystem::path& filePath) {
        std::ifstream inputFile(filePath);

        if (!inputFile.is_open()) {
            std::cerr << fmt::format("Can't open file {}", filePath.string()) << std::endl;

            return std::vector<std::string>();
        }

        return readLines(inputFile);
    }

    std::vector<std::string> readLines(std::istream& is) {
        std::vector<std::string> lines;

        while (is) {
            std::string line;
            std::getline(is, line);

            if (line.size() > 0) {
                lines.push_back(line);
            }
        }

        return lines;
    }

    bool isInteractive(std::ostream& os) {
#ifdef _WIN32
        if (&os == &std::cout) {
            return _isatty(_fileno(stdout)) != 0;
        }
        if (&os == &std::cerr || &os == &std::clog) {
            return _isatty(_fileno(stderr)) != 0;
        }
#else
        if (&os == &std::cout) {
            return isatty(STDOUT_FILENO) != 0;
        }
        if (&os == &std::cerr || &os == &std::clog) {
            return isatty(STDERR_FILENO) != 0;
        }
#endif // _WIN32

        return false;
    }
}
