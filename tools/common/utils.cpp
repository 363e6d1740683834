// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <yaml-cpp/yaml.h>

#include "confscrub.h"
#include "utils.hpp"

using namespace std::literals;

namespace YAML {

namespace {

template <typename T>
void read_optional(const Node &node, std::string_view name, std::optional<T> &output)
{
    auto child = node[std::string{name}];
    if (!child.IsDefined() || child.IsNull()) {
        return;
    }

    if (!child.IsScalar()) {
        throw parsing_error("'" + std::string{name} + "' must be a scalar");
    }

    try {
        output = child.as<T>();
    } catch (const BadConversion &e) {
        throw parsing_error("invalid value for '" + std::string{name} + "': " + e.what());
    }
}

void read_pattern(const Node &node, std::string_view name, std::string &output)
{
    std::optional<std::string> pattern;
    read_optional(node, name, pattern);
    if (pattern.has_value()) {
        output = std::move(*pattern);
    }
}

} // namespace

scrub_settings as_if<scrub_settings, void>::operator()() const
{
    scrub_settings settings;
    if (node.IsNull()) {
        return settings;
    }

    if (!node.IsMap()) {
        throw parsing_error("configuration root must be a map");
    }

    read_optional(node, "redaction_text"sv, settings.redaction_marker);
    read_optional(node, "check_values"sv, settings.check_values);
    read_optional(node, "include_comments"sv, settings.include_comments);
    read_optional(node, "remove_comments"sv, settings.remove_comments);

    auto patterns = node["patterns"];
    if (patterns.IsDefined() && !patterns.IsNull()) {
        if (!patterns.IsMap()) {
            throw parsing_error("'patterns' must be a map");
        }

        read_pattern(patterns, "key"sv, settings.key_regex);
        read_pattern(patterns, "exclude"sv, settings.exclusion_regex);
        read_pattern(patterns, "value"sv, settings.value_regex);
    }

    return settings;
}

} // namespace YAML

void scrub_settings::merge(const scrub_settings &overrides)
{
    if (overrides.redaction_marker.has_value()) {
        redaction_marker = overrides.redaction_marker;
    }
    if (overrides.check_values.has_value()) {
        check_values = overrides.check_values;
    }
    if (overrides.include_comments.has_value()) {
        include_comments = overrides.include_comments;
    }
    if (overrides.remove_comments.has_value()) {
        remove_comments = overrides.remove_comments;
    }
    if (!overrides.key_regex.empty()) {
        key_regex = overrides.key_regex;
    }
    if (!overrides.exclusion_regex.empty()) {
        exclusion_regex = overrides.exclusion_regex;
    }
    if (!overrides.value_regex.empty()) {
        value_regex = overrides.value_regex;
    }
}

confscrub_config scrub_settings::to_config() const
{
    auto c_str_or_null = [](const std::string &str) {
        return str.empty() ? nullptr : str.c_str();
    };

    confscrub_config config{};
    config.redaction.marker = redaction_marker.has_value() ? redaction_marker->c_str() : nullptr;
    config.patterns.key_regex = c_str_or_null(key_regex);
    config.patterns.exclusion_regex = c_str_or_null(exclusion_regex);
    config.patterns.value_regex = c_str_or_null(value_regex);
    config.check_values = check_values.value_or(true);
    config.include_comments = include_comments.value_or(false);
    config.remove_comments = remove_comments.value_or(false);
    return config;
}

const char* level_to_str(CONFSCRUB_LOG_LEVEL level)
{
    switch (level)
    {
        case CONFSCRUB_LOG_TRACE:
            return "trace";
        case CONFSCRUB_LOG_DEBUG:
            return "debug";
        case CONFSCRUB_LOG_ERROR:
            return "error";
        case CONFSCRUB_LOG_WARN:
            return "warn";
        case CONFSCRUB_LOG_INFO:
            return "info";
        case CONFSCRUB_LOG_OFF:
            break;
    }

    return "off";
}

// Redacted documents go to stdout, logs never do
void log_cb(CONFSCRUB_LOG_LEVEL level,
            const char* function, const char* file, unsigned line,
            const char* message, uint64_t  /*length*/)
{
    std::cerr << "[" << level_to_str(level)
              << "][" << file
              << ":" << function
              << ":" << line
              << "]: " << message
              << '\n';
}

std::string read_file(std::string_view filename)
{
    // Binary mode, line terminators must survive untouched
    std::ifstream input_file(std::string{filename}, std::ios::in | std::ios::binary);
    if (!input_file)
    {
        throw std::system_error(errno, std::generic_category(), std::string{filename});
    }

    // Create a buffer equal to the file size
    std::string buffer;
    input_file.seekg(0, std::ios::end);
    buffer.resize(input_file.tellg());
    input_file.seekg(0, std::ios::beg);

    input_file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    input_file.close();
    return buffer;
}

void write_file(std::string_view filename, std::string_view contents)
{
    std::ofstream output_file(
        std::string{filename}, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!output_file)
    {
        throw std::system_error(errno, std::generic_category(), std::string{filename});
    }

    output_file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    if (!output_file)
    {
        throw std::system_error(errno, std::generic_category(), std::string{filename});
    }
}

void backup_file(std::string_view filename, std::string_view suffix)
{
    const std::filesystem::path source{filename};
    std::filesystem::path destination{source};
    destination += suffix;

    std::filesystem::copy_file(
        source, destination, std::filesystem::copy_options::overwrite_existing);
}
