#include "tidy/logging/handlers/FileHandler.h"
#include "fmt/format.h"

#include <cerrno>
#include <system_error>

namespace tidy::logging::handlers {
    static std::ios_base::openmode toOpenMode(FileMode mode) {
        if (mode == FileMode::Overwrite) {
            return std::ios::out | std::ios::trunc;
        }

        return std::ios::out | std::ios::app;
    }

    FileHandler::FileHandler(
        const std::filesystem::path& filePath,
        FileMode mode,
        Level level,
        Formatter formatter
    ) : Handler(level, std::move(formatter)), _filePath(filePath) {
        openStream(toOpenMode(mode));
    }

    void FileHandler::openStream(std::ios_base::openmode mode) {
        errno = 0;
        _stream.open(_filePath, mode);

        if (!_stream.is_open()) {
            int error = errno != 0 ? errno : EIO;
            throw std::system_error(error, std::generic_category(), fmt::format("Can't open log file {}", _filePath.string()));
        }
    }

    void FileHandler::emit(const Record& record) {
        if (!_stream.is_open()) {
            return;
        }

        _stream << format(record) << std::endl;
    }

    void FileHandler::doFlush() {
        if (_stream.is_open()) {
            _stream.flush();
        }
    }

    void FileHandler::doClose() {
        if (_stream.is_open()) {
            _stream.flush();
            _stream.close();
        }
    }
}
