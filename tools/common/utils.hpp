// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <yaml-cpp/yaml.h>

#include "confscrub.h"

// Options gathered from a YAML file and the command line, the latter
// overriding the former.
struct scrub_settings {
    std::optional<std::string> redaction_marker;
    std::optional<bool> check_values;
    std::optional<bool> include_comments;
    std::optional<bool> remove_comments;
    std::string key_regex;
    std::string exclusion_regex;
    std::string value_regex;

    void merge(const scrub_settings &overrides);

    // The returned structure points into this object
    [[nodiscard]] confscrub_config to_config() const;
};

namespace YAML
{

class parsing_error : public std::exception
{
public:
    explicit parsing_error(std::string what) : what_(std::move(what)) {}
    [[nodiscard]] const char *what() const noexcept override { return what_.c_str(); }

protected:
    const std::string what_;
};

template <>
struct as_if<scrub_settings, void>
{
    explicit as_if(const Node& node_) : node(node_) {}
    scrub_settings operator()() const;
    const Node& node;
};

} // namespace YAML

const char* level_to_str(CONFSCRUB_LOG_LEVEL level);

void log_cb(CONFSCRUB_LOG_LEVEL level, const char* function, const char* file,
    unsigned line, const char* message, uint64_t length);

std::string read_file(std::string_view filename);
void write_file(std::string_view filename, std::string_view contents);

// Copies filename to filename + suffix, overwriting any previous backup
void backup_file(std::string_view filename, std::string_view suffix);
