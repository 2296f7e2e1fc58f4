#pragma once

#include "tidy/logging/handlers/FileHandler.h"
#include <cstddef>
#include <cstdint>

namespace tidy::logging::handlers {
    // Rolls "name" over to "name.1", "name.2", ... keeping at most backupCount files.
    // Rollover is disabled when either maxBytes or backupCount is zero.
    class RotatingFileHandler : public FileHandler {
    public:
        RotatingFileHandler(
            const std::filesystem::path& filePath,
            FileMode mode,
            std::size_t maxBytes,
            uint32_t backupCount,
            Level level,
            Formatter formatter = defaultFormatter
        );

        std::size_t getMaxBytes() const {
            return _maxBytes;
        }

        uint32_t getBackupCount() const {
            return _backupCount;
        }

        std::filesystem::path getBackupPath(uint32_t index) const;

    protected:
        void emit(const Record& record) override;

    private:
        bool shouldRollover(const std::string& line) const;
        void doRollover();

        std::size_t _maxBytes;
        uint32_t _backupCount;
        std::size_t _currentSize;
    };
}
