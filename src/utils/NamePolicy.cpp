#include "tidy/utils/NamePolicy.h"
#include "tidy/errors.h"
#include "fmt/format.h"

#include <algorithm>
#include <cctype>
#include <set>
#include <string>
#include <vector>

namespace tidy::utils {
    static std::vector<std::string> splitComponents(const std::string& pathString) {
        std::vector<std::string> components;
        std::string component;

        for (char ch : pathString) {
            if (ch == '/' || ch == '\\') {
                if (!component.empty()) {
                    components.push_back(component);
                }
                component.clear();
            }
            else {
                component.push_back(ch);
            }
        }

        if (!component.empty()) {
            components.push_back(component);
        }

        return components;
    }

    // Strips a leading drive designator such as "C:".
    static std::string stripDrive(const std::string& pathString) {
        if (pathString.size() >= 2 && pathString[1] == ':' && std::isalpha(static_cast<unsigned char>(pathString[0]))) {
            return pathString.substr(2);
        }

        return pathString;
    }

    const NamePolicy& NamePolicy::forCurrentPlatform() {
#ifdef _WIN32
        static const WindowsNamePolicy policy;
#else
        static const PosixNamePolicy policy;
#endif // _WIN32

        return policy;
    }

    void PosixNamePolicy::validate(const std::filesystem::path&) const {
    }

    bool WindowsNamePolicy::isReservedName(const std::string& component) {
        static const std::set<std::string> ReservedNames = [] {
            std::set<std::string> names{ "CON", "PRN", "AUX", "NUL" };
            for (int index = 1; index <= 9; ++index) {
                names.insert(fmt::format("COM{}", index));
                names.insert(fmt::format("LPT{}", index));
            }

            return names;
        }();

        std::string stem = std::filesystem::path(component).stem().string();
        std::transform(stem.begin(), stem.end(), stem.begin(), [](unsigned char ch) {
            return static_cast<char>(std::toupper(ch));
        });

        return ReservedNames.count(stem) > 0;
    }

    void WindowsNamePolicy::validate(const std::filesystem::path& filePath) const {
        const std::string pathString = stripDrive(filePath.string());

        for (const auto& component : splitComponents(pathString)) {
            if (component.find_first_of(INVALID_CHARACTERS) != std::string::npos) {
                throw InvalidNameError(fmt::format("File name contains invalid characters for Windows paths: {}", filePath.string()));
            }

            if (isReservedName(component)) {
                throw InvalidNameError(fmt::format("File name contains reserved Windows device name {}: {}", component, filePath.string()));
            }
        }
    }
}
