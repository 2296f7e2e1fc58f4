#include "tidy/logging/handlers/RotatingFileHandler.h"
#include "fmt/format.h"

#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace tidy::logging::handlers {
    // Returns false when source exists but could not be moved.
    static bool renameIfExists(const fs::path& source, const fs::path& target) {
        std::error_code errorCode;
        if (!fs::exists(source, errorCode)) {
            return true;
        }

        fs::remove(target, errorCode);
        fs::rename(source, target, errorCode);
        if (errorCode) {
            std::cerr << fmt::format("Can't rotate log file {} to {}: {}",
                source.string(), target.string(), errorCode.message()) << std::endl;

            return false;
        }

        return true;
    }

    RotatingFileHandler::RotatingFileHandler(
        const fs::path& filePath,
        FileMode mode,
        std::size_t maxBytes,
        uint32_t backupCount,
        Level level,
        Formatter formatter
    ) : FileHandler(filePath, mode, level, std::move(formatter)),
        _maxBytes(maxBytes), _backupCount(backupCount), _currentSize(0) {
        std::error_code errorCode;
        auto fileSize = fs::file_size(_filePath, errorCode);
        if (!errorCode) {
            _currentSize = static_cast<std::size_t>(fileSize);
        }
    }

    fs::path RotatingFileHandler::getBackupPath(uint32_t index) const {
        return fs::path(fmt::format("{}.{}", _filePath.string(), index));
    }

    void RotatingFileHandler::emit(const Record& record) {
        if (!_stream.is_open()) {
            return;
        }

        std::string line = format(record);
        line.push_back('\n');

        if (shouldRollover(line)) {
            doRollover();

            if (!_stream.is_open()) {
                return;
            }
        }

        _stream << line << std::flush;
        _currentSize += line.size();
    }

    bool RotatingFileHandler::shouldRollover(const std::string& line) const {
        if (_maxBytes == 0 || _backupCount == 0 || _currentSize == 0) {
            return false;
        }

        return _currentSize + line.size() >= _maxBytes;
    }

    void RotatingFileHandler::doRollover() {
        _stream.close();

        for (uint32_t backupIndex = _backupCount - 1; backupIndex > 0; --backupIndex) {
            renameIfExists(getBackupPath(backupIndex), getBackupPath(backupIndex + 1));
        }
        bool moved = renameIfExists(_filePath, getBackupPath(1));

        try {
            if (moved) {
                openStream(std::ios::out | std::ios::trunc);
                _currentSize = 0;
            }
            else {
                // The records are still in the base file, keep writing after them.
                openStream(std::ios::out | std::ios::app);
            }
        }
        catch (const std::system_error& e) {
            std::cerr << fmt::format("Can't reopen log file after rotation: {}", e.what()) << std::endl;
        }
    }
}
