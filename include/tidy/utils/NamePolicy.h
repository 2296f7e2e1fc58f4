#pragma once

#include <filesystem>
#include <memory>

namespace tidy::utils {
    // Platform specific file name rules, applied after the common empty and null byte checks.
    // validate() throws InvalidNameError.
    class NamePolicy {
    public:
        virtual ~NamePolicy() {}

        virtual void validate(const std::filesystem::path& filePath) const = 0;

        static const NamePolicy& forCurrentPlatform();
    };

    class PosixNamePolicy : public NamePolicy {
    public:
        void validate(const std::filesystem::path& filePath) const override;
    };

    class WindowsNamePolicy : public NamePolicy {
    public:
        static constexpr const char* INVALID_CHARACTERS = "<>:\"/\\|?*";

        void validate(const std::filesystem::path& filePath) const override;

        static bool isReservedName(const std::string& component);
    };
}
