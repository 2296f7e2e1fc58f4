#include "tidy/logging/Logger.h"
#include "tidy/logging/handlers/FileHandler.h"
#include "tidy/logging/handlers/RotatingFileHandler.h"
#include "tidy/utils/io_utils.h"
#include "framework.h"

#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

using tidy::logging::Level;
using tidy::logging::Logger;
using tidy::logging::createHandler;
using tidy::logging::handlers::FileHandler;
using tidy::logging::handlers::FileMode;
using tidy::logging::handlers::RotatingFileHandler;

static void writeFile(const fs::path& filePath, const std::string& content) {
    std::ofstream os(filePath);
    os << content;
}

void testFileHandlerAppendsAndOverwrites() {
    tidy::test::ScopedWorkDir workDir;
    writeFile("append.log", "previous\n");
    writeFile("overwrite.log", "previous\n");

    Logger logger("Files", Level::Debug);
    auto appendHandler = createHandler<FileHandler>("append.log", FileMode::Append, Level::Debug);
    auto overwriteHandler = createHandler<FileHandler>("overwrite.log", FileMode::Overwrite, Level::Debug);
    logger.addHandler(appendHandler);
    logger.addHandler(overwriteHandler);

    logger.info("next");

    auto appendLines = tidy::utils::readLines("append.log");
    ASSERT_EQ(appendLines.size(), static_cast<std::size_t>(2));
    ASSERT_EQ(appendLines[0], std::string("previous"));
    ASSERT_EQ(appendLines[1], std::string("INFO:Files:next"));

    auto overwriteLines = tidy::utils::readLines("overwrite.log");
    ASSERT_EQ(overwriteLines.size(), static_cast<std::size_t>(1));
    ASSERT_EQ(overwriteHandler->getFilePath(), fs::path("overwrite.log"));
}

void testFileHandlerThrowsWhenFileCantBeOpened() {
    tidy::test::ScopedWorkDir workDir;

    ASSERT_THROWS(
        createHandler<FileHandler>("missing_dir/app.log", FileMode::Append, Level::Debug),
        std::system_error
    );
}

void testFileHandlerDropsRecordsAfterClose() {
    tidy::test::ScopedWorkDir workDir;
    Logger logger("Closed", Level::Debug);
    auto handler = createHandler<FileHandler>("closed.log", FileMode::Overwrite, Level::Debug);
    logger.addHandler(handler);

    logger.info("before");
    handler->close();
    handler->close();
    logger.info("after");

    ASSERT_EQ(tidy::utils::readLines("closed.log").size(), static_cast<std::size_t>(1));
}

void testRotatingFileHandlerKeepsBackupCount() {
    tidy::test::ScopedWorkDir workDir;
    Logger logger("Rotate", Level::Debug);
    auto handler = createHandler<RotatingFileHandler>("rotate.log", FileMode::Append, 200, 2, Level::Debug);
    logger.addHandler(handler);

    for (int messageIndex = 0; messageIndex != 40; ++messageIndex) {
        logger.info("message number {:04} with some padding text", messageIndex);
    }
    handler->close();

    ASSERT_TRUE(fs::exists("rotate.log"));
    ASSERT_TRUE(fs::exists("rotate.log.1"));
    ASSERT_TRUE(fs::exists("rotate.log.2"));
    ASSERT_FALSE(fs::exists("rotate.log.3"));
    ASSERT_EQ(handler->getBackupPath(2), fs::path("rotate.log.2"));

    for (const auto& filePath : { "rotate.log", "rotate.log.1", "rotate.log.2" }) {
        ASSERT_TRUE(fs::file_size(filePath) < 200);
    }

    // The newest records stay in the base file, older ones move to higher indexes.
    auto currentLines = tidy::utils::readLines("rotate.log");
    auto oldestLines = tidy::utils::readLines("rotate.log.2");
    ASSERT_FALSE(currentLines.empty());
    ASSERT_FALSE(oldestLines.empty());
    ASSERT_TRUE(currentLines.back().find("0039") != std::string::npos);
    ASSERT_TRUE(oldestLines.back() < currentLines.front());
}

void testRotatingFileHandlerWithoutBackupsNeverRotates() {
    tidy::test::ScopedWorkDir workDir;
    Logger logger("NoRotate", Level::Debug);
    auto handler = createHandler<RotatingFileHandler>("grow.log", FileMode::Append, 100, 0, Level::Debug);
    logger.addHandler(handler);

    for (int messageIndex = 0; messageIndex != 20; ++messageIndex) {
        logger.info("message number {:04}", messageIndex);
    }
    handler->close();

    ASSERT_FALSE(fs::exists("grow.log.1"));
    ASSERT_EQ(tidy::utils::readLines("grow.log").size(), static_cast<std::size_t>(20));
}

void testRotatingFileHandlerCountsExistingContent() {
    tidy::test::ScopedWorkDir workDir;
    writeFile("existing.log", std::string(150, 'x') + "\n");

    Logger logger("Existing", Level::Debug);
    auto handler = createHandler<RotatingFileHandler>("existing.log", FileMode::Append, 160, 1, Level::Debug);
    logger.addHandler(handler);

    logger.info("this line does not fit");
    handler->close();

    ASSERT_TRUE(fs::exists("existing.log.1"));
    ASSERT_EQ(tidy::utils::readLines("existing.log.1").size(), static_cast<std::size_t>(1));
    ASSERT_EQ(tidy::utils::readLines("existing.log").size(), static_cast<std::size_t>(1));
}

void testRotatingFileHandlerKeepsRecordsWhenBackupIsBlocked() {
    tidy::test::ScopedWorkDir workDir;
    fs::create_directories("blocked.log.1/keep");
    writeFile("blocked.log.1/keep/x", "x");

    Logger logger("Blocked", Level::Debug);
    auto handler = createHandler<RotatingFileHandler>("blocked.log", FileMode::Append, 120, 1, Level::Debug);
    logger.addHandler(handler);

    for (int messageIndex = 0; messageIndex != 6; ++messageIndex) {
        logger.info("record {:02} padded to roughly sixty bytes of text", messageIndex);
    }
    handler->close();

    auto lines = tidy::utils::readLines("blocked.log");
    ASSERT_EQ(lines.size(), static_cast<std::size_t>(6));
    ASSERT_TRUE(lines.front().find("record 00") != std::string::npos);
    ASSERT_TRUE(lines.back().find("record 05") != std::string::npos);
    ASSERT_TRUE(fs::is_regular_file("blocked.log.1/keep/x"));
}
