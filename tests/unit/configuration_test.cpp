// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include "configuration.hpp"
#include "exception.hpp"

#include "common/gtest_utils.hpp"

using namespace confscrub;

namespace {

TEST(TestConfiguration, Defaults)
{
    configuration config;

    EXPECT_STR(config.redaction_marker, "***REDACTED***");
    EXPECT_TRUE(config.check_values);
    EXPECT_FALSE(config.include_comments);
    EXPECT_FALSE(config.remove_comments);
    EXPECT_EQ(config.keys, key_classifier::default_instance());
    EXPECT_EQ(config.values, value_classifier::default_instance());
    EXPECT_NO_THROW(config.validate());
}

TEST(TestConfiguration, InvalidMarker)
{
    configuration config;

    config.redaction_marker = "";
    EXPECT_THROW(config.validate(), invalid_configuration);

    config.redaction_marker = "multi\nline";
    EXPECT_THROW(config.validate(), invalid_configuration);

    config.redaction_marker = "carriage\rreturn";
    EXPECT_THROW(config.validate(), invalid_configuration);

    config.redaction_marker = "[hidden]";
    EXPECT_NO_THROW(config.validate());
}

TEST(TestConfiguration, MissingClassifier)
{
    configuration config;
    config.keys.reset();
    EXPECT_THROW(config.validate(), invalid_configuration);

    config = configuration{};
    config.values.reset();
    EXPECT_THROW(config.validate(), invalid_configuration);
}

TEST(TestConfiguration, EmptyPatternsKeepBuiltinTables)
{
    configuration config;
    config.set_patterns("", "", "");

    EXPECT_EQ(config.keys, key_classifier::default_instance());
    EXPECT_EQ(config.values, value_classifier::default_instance());
}

TEST(TestConfiguration, AdditionalPatterns)
{
    configuration config;
    config.set_patterns("^internal_", "_public$", "^corp-[0-9]+$");

    EXPECT_NE(config.keys, key_classifier::default_instance());
    EXPECT_NE(config.values, value_classifier::default_instance());

    EXPECT_TRUE(config.keys->classify("internal_host").sensitive);
    EXPECT_FALSE(config.keys->classify("secret_public").sensitive);
    EXPECT_TRUE(config.keys->classify("password").sensitive);

    EXPECT_TRUE(config.values->classify("corp-1234").sensitive);
    EXPECT_FALSE(config.values->classify("corp-abcd").sensitive);
}

TEST(TestConfiguration, ValuePatternOnly)
{
    configuration config;
    config.set_patterns("", "", "^corp-[0-9]+$");

    EXPECT_EQ(config.keys, key_classifier::default_instance());
    EXPECT_NE(config.values, value_classifier::default_instance());
}

TEST(TestConfiguration, InvalidPattern)
{
    configuration config;
    EXPECT_THROW(config.set_patterns("(", "", ""), invalid_configuration);
    EXPECT_THROW(config.set_patterns("", "[", ""), invalid_configuration);
    EXPECT_THROW(config.set_patterns("", "", "*"), invalid_configuration);
}

} // namespace
