// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdint>
#include <string>
#include <vector>

#include "confscrub.h"
#include "log.hpp"

#include "common/gtest_utils.hpp"

using namespace confscrub;

namespace {

struct log_entry {
    CONFSCRUB_LOG_LEVEL level;
    std::string file;
    std::string message;
    uint64_t length;
};

std::vector<log_entry> captured;

void capture_cb(CONFSCRUB_LOG_LEVEL level, const char * /*function*/, const char *file,
    unsigned /*line*/, const char *message, uint64_t length)
{
    captured.push_back({level, file, message, length});
}

class TestLog : public ::testing::Test {
public:
    void SetUp() override { captured.clear(); }
    void TearDown() override { confscrub_set_log_cb(nullptr, CONFSCRUB_LOG_OFF); }
};

TEST(TestLogHelpers, SourceFileName)
{
    static_assert(source_file_name("src/classifier/key_classifier.cpp") == "key_classifier.cpp");
    EXPECT_STR(source_file_name("/abs/path/log.cpp"), "log.cpp");
    EXPECT_STR(source_file_name(R"(C:\src\log.cpp)"), "log.cpp");
    EXPECT_STR(source_file_name("log.cpp"), "log.cpp");
    EXPECT_STR(source_file_name("src/").data(), "");
}

TEST(TestLogHelpers, LevelToString)
{
    EXPECT_STR(log_level_to_str(CONFSCRUB_LOG_TRACE), "trace");
    EXPECT_STR(log_level_to_str(CONFSCRUB_LOG_WARN), "warn");
    EXPECT_STR(log_level_to_str(CONFSCRUB_LOG_OFF), "off");
}

TEST_F(TestLog, FormatsAndForwards)
{
    confscrub_set_log_cb(capture_cb, CONFSCRUB_LOG_DEBUG);
    captured.clear();

    CONFSCRUB_DEBUG("scanned {} lines in {}", 3, std::string{"app.toml"});
    CONFSCRUB_ERROR("no arguments");

    ASSERT_EQ(captured.size(), 2);
    EXPECT_EQ(captured[0].level, CONFSCRUB_LOG_DEBUG);
    EXPECT_STR(captured[0].message, "scanned 3 lines in app.toml");
    EXPECT_EQ(captured[0].length, captured[0].message.size());
    EXPECT_STR(captured[0].file, "log_test.cpp");
    EXPECT_STR(captured[1].message, "no arguments");
}

TEST_F(TestLog, MinimumLevel)
{
    confscrub_set_log_cb(capture_cb, CONFSCRUB_LOG_WARN);
    captured.clear();

    CONFSCRUB_TRACE("dropped");
    CONFSCRUB_INFO("dropped");
    CONFSCRUB_WARN("kept");

    ASSERT_EQ(captured.size(), 1);
    EXPECT_EQ(captured[0].level, CONFSCRUB_LOG_WARN);
}

TEST_F(TestLog, Disabled)
{
    confscrub_set_log_cb(capture_cb, CONFSCRUB_LOG_OFF);
    CONFSCRUB_ERROR("dropped");

    confscrub_set_log_cb(nullptr, CONFSCRUB_LOG_TRACE);
    CONFSCRUB_ERROR("dropped");

    EXPECT_TRUE(captured.empty());
}

} // namespace
