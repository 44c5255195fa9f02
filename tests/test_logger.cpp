// EN: Unit tests for the NDJSON Logger
// FR: Tests unitaires pour le Logger NDJSON

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "infrastructure/logging/logger.hpp"

using namespace PHR;

// EN: Test fixture redirecting the logger to a temporary file
// FR: Fixture de test redirigeant le logger vers un fichier temporaire
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_path_ = std::filesystem::temp_directory_path() / "phonyrun_logger_test.ndjson";
        std::filesystem::remove(log_path_);
        auto& logger = Logger::getInstance();
        logger.clearGlobalMetadata();
        logger.setCorrelationId("");
        logger.setLogLevel(LogLevel::DEBUG);
        ASSERT_TRUE(logger.setOutputFile(log_path_.string()));
    }

    void TearDown() override {
        auto& logger = Logger::getInstance();
        logger.setOutputFile("");
        logger.clearGlobalMetadata();
        logger.setCorrelationId("");
        logger.setLogLevel(LogLevel::INFO);
        std::filesystem::remove(log_path_);
    }

    std::vector<nlohmann::json> readEntries() {
        Logger::getInstance().flush();
        std::vector<nlohmann::json> entries;
        std::ifstream file(log_path_);
        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty()) {
                entries.push_back(nlohmann::json::parse(line));
            }
        }
        return entries;
    }

    std::filesystem::path log_path_;
};

TEST_F(LoggerTest, WritesOneJsonObjectPerLine) {
    LOG_INFO("resolver", "Resolved variable");
    LOG_ERROR("executor", "Step failed");

    auto entries = readEntries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0]["level"], "INFO");
    EXPECT_EQ(entries[0]["module"], "resolver");
    EXPECT_EQ(entries[0]["message"], "Resolved variable");
    EXPECT_TRUE(entries[0].contains("timestamp"));
    EXPECT_TRUE(entries[0].contains("thread_id"));
    EXPECT_EQ(entries[1]["level"], "ERROR");
}

TEST_F(LoggerTest, EntriesBelowLevelAreDropped) {
    Logger::getInstance().setLogLevel(LogLevel::WARN);
    LOG_DEBUG("test", "hidden");
    LOG_INFO("test", "hidden");
    LOG_WARN("test", "shown");

    auto entries = readEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]["message"], "shown");
    EXPECT_EQ(Logger::getInstance().getLogLevel(), LogLevel::WARN);
}

TEST_F(LoggerTest, MetadataAndCorrelationId) {
    auto& logger = Logger::getInstance();
    logger.setCorrelationId("run-42");
    logger.addGlobalMetadata("taskfile", "Taskfile");
    logger.addGlobalMetadata("task", "global");

    LOG_INFO_META("executor", "Task completed",
                  (std::unordered_map<std::string, std::string>{{"task", "build"}, {"steps", "2"}}));

    auto entries = readEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]["correlation_id"], "run-42");
    EXPECT_EQ(entries[0]["taskfile"], "Taskfile");
    // EN: Entry metadata wins over global metadata
    // FR: Les métadonnées de l'entrée priment sur les globales
    EXPECT_EQ(entries[0]["task"], "build");
    EXPECT_EQ(entries[0]["steps"], "2");
}

TEST_F(LoggerTest, FormatEscapesQuotesAndKeepsReservedKeys) {
    Logger::LogEntry entry;
    entry.timestamp = std::chrono::system_clock::time_point{};
    entry.level = LogLevel::WARN;
    entry.module = "parser";
    entry.message = "unexpected \"token\"\n";
    entry.thread_id = "1";
    entry.metadata["level"] = "overridden";

    nlohmann::json parsed = nlohmann::json::parse(Logger::formatAsNDJSON(entry));
    EXPECT_EQ(parsed["message"], "unexpected \"token\"\n");
    EXPECT_EQ(parsed["level"], "WARN");
    EXPECT_EQ(parsed["timestamp"], "1970-01-01T00:00:00.000Z");
    EXPECT_FALSE(parsed.contains("correlation_id"));
}

TEST(LoggerLevelTest, LevelNamesRoundTrip) {
    EXPECT_EQ(Logger::levelFromString("debug").value(), LogLevel::DEBUG);
    EXPECT_EQ(Logger::levelFromString("Warning").value(), LogLevel::WARN);
    EXPECT_EQ(Logger::levelFromString("ERROR").value(), LogLevel::ERROR);
    EXPECT_FALSE(Logger::levelFromString("verbose").has_value());
    EXPECT_EQ(Logger::levelToString(LogLevel::INFO), "INFO");
}

TEST(LoggerCorrelationTest, GeneratedIdsLookLikeUuids) {
    auto& logger = Logger::getInstance();
    std::string first = logger.generateCorrelationId();
    std::string second = logger.generateCorrelationId();

    EXPECT_EQ(first.size(), 36u);
    EXPECT_EQ(first[8], '-');
    EXPECT_EQ(first[23], '-');
    EXPECT_NE(first, second);
}

TEST(LoggerFileTest, UnwritableFileFallsBackToConsole) {
    auto& logger = Logger::getInstance();
    EXPECT_FALSE(logger.setOutputFile("/nonexistent/dir/phonyrun.log"));
    logger.setOutputFile("");
}
