#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <regex>
#include "InteractionLogger.hpp"

using namespace edubot;
using json = nlohmann::json;
namespace fs = std::filesystem;

TEST(InteractionRecordTest, NeverStoresRawQueryOrSession) {
    auto record = make_record("session-abc", "How do I enroll?", "course",
                              {"How to enroll in a course"}, 1.23456, false, "Open the catalog.");
    auto j = record.to_json();
    std::string dumped = j.dump();

    EXPECT_EQ(dumped.find("session-abc"), std::string::npos);
    EXPECT_EQ(dumped.find("How do I enroll?"), std::string::npos);
    EXPECT_EQ(j["query_length"], 16);
    EXPECT_EQ(j["response_preview_length"], 17);
    EXPECT_EQ(j["intent"], "course");
    EXPECT_DOUBLE_EQ(j["latency_seconds"].get<double>(), 1.235);
    EXPECT_EQ(j["retrieved_docs"][0], "How to enroll in a course");
}

TEST(InteractionRecordTest, AnonymizedHashIsStableHex) {
    auto a = anonymize_session("learner-1");
    EXPECT_EQ(a.size(), 16u);
    EXPECT_TRUE(std::regex_match(a, std::regex("[0-9a-f]{16}")));
    EXPECT_EQ(a, anonymize_session("learner-1"));
    EXPECT_NE(a, anonymize_session("learner-2"));
}

TEST(InteractionRecordTest, RecordNeverCarriesRawSessionId) {
    auto record = make_record("learner-1234567890", "How do I enroll?", "course", {}, 0.1, false, "ok");
    auto dumped = record.to_json().dump();
    EXPECT_EQ(dumped.find("learner-1234567890"), std::string::npos);
    EXPECT_EQ(record.user_hash, anonymize_session("learner-1234567890"));
}

TEST(InteractionRecordTest, TimestampIsUtcIso8601) {
    EXPECT_TRUE(std::regex_match(utc_timestamp_now(),
                                 std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{6}Z)")));
}

TEST(InteractionLoggerTest, KeepsNewestRecordsFirstAndBounded) {
    InteractionLogger logger("");
    for (size_t i = 0; i < InteractionLogger::kRecentCapacity + 5; ++i) {
        logger.log(make_record("s", std::string(i + 1, 'x'), "general", {}, 0.0, false, ""));
    }
    EXPECT_EQ(logger.recent_count(), InteractionLogger::kRecentCapacity);

    auto recent = logger.recent_json();
    EXPECT_EQ(recent.size(), InteractionLogger::kRecentCapacity);
    EXPECT_EQ(recent[0]["query_length"], InteractionLogger::kRecentCapacity + 5);
}

TEST(InteractionLoggerTest, AppendsJsonLines) {
    fs::path dir = fs::temp_directory_path() / "edubot_log_test";
    fs::remove_all(dir);
    fs::path file = dir / "nested" / "interactions.jsonl";

    InteractionLogger logger(file.string());
    logger.log(make_record("s1", "quiz?", "assessment", {}, 0.1, false, "a"));
    logger.log(make_record("s2", "cheat", "blocked", {}, 0.0, true, "b"));

    std::ifstream in(file);
    std::string line;
    std::vector<json> lines;
    while (std::getline(in, line)) lines.push_back(json::parse(line));

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["intent"], "assessment");
    EXPECT_TRUE(lines[1]["safety_triggered"].get<bool>());
    fs::remove_all(dir);
}

TEST(InteractionLoggerTest, UnwritableSinkDoesNotThrow) {
    fs::path blocker = fs::temp_directory_path() / "edubot_log_blocker";
    {
        std::ofstream out(blocker);
        out << "plain file";
    }
    // A regular file where a directory is expected
    InteractionLogger logger((blocker / "sub" / "log.jsonl").string());
    EXPECT_NO_THROW(logger.log(make_record("s", "q", "general", {}, 0.0, false, "r")));
    EXPECT_EQ(logger.recent_count(), 1u);
    fs::remove(blocker);
}
