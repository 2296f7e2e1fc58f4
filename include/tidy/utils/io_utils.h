#pragma once

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace tidy::utils {
    // Throws std::runtime_error when the file can't be opened.
    std::string readFile(const std::filesystem::path& filePath);

    std::vector<std::string> readLines(const std::filesystem::path& filePath);
    std::vector<std::string> readLines(std::istream& is);

    bool isInteractive(std::ostream& os);
}
