#pragma once

#include "tidy/logging/Handler.h"
#include <fstream>
#include <string>
#include <filesystem>

namespace tidy::logging::handlers {
    enum class FileMode {
        Append,
        Overwrite,
    };

    class FileHandler : public Handler {
    public:
        FileHandler(
            const std::filesystem::path& filePath,
            FileMode mode,
            Level level,
            Formatter formatter = defaultFormatter
        );

        const std::filesystem::path& getFilePath() const {
            return _filePath;
        }

    protected:
        void emit(const Record& record) override;
        void doFlush() override;
        void doClose() override;

        void openStream(std::ios_base::openmode mode);

        std::filesystem::path _filePath;
        std::ofstream _stream;
    };
}
