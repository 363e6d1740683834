// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace confscrub {

enum class line_kind : uint8_t {
    blank,
    comment,
    section,
    // [[name]], recorded but never parsed further
    table_array,
    key_value,
    // Anything else: malformed lines, arrays, inline tables, multi-line strings
    opaque,
};

enum class match_reason : uint8_t { none, key_name, value_pattern };

std::string_view to_string(line_kind kind);
std::string_view to_string(match_reason reason);

struct line_record {
    // Line contents without the terminator
    std::string text;
    // "\n", "\r\n" or empty for an unterminated last line
    std::string terminator;
    std::size_t number{0};
    std::optional<std::string> section;
    line_kind kind{line_kind::opaque};

    std::optional<std::string> key;
    std::optional<std::string> value;
    // Position of the value within text, quotes excluded
    std::size_t value_offset{0};
    std::size_t value_length{0};

    bool sensitive{false};
    match_reason reason{match_reason::none};
    std::string pattern;

    [[nodiscard]] bool is_comment() const { return kind == line_kind::comment; }
};

struct finding {
    std::size_t line{0};
    std::optional<std::string> section;
    std::string key;
    match_reason reason{match_reason::none};
    std::string pattern;
    bool commented{false};
};

// Records in document order along with the findings derived from them
class scan_result {
public:
    scan_result() = default;
    explicit scan_result(std::vector<line_record> records);

    [[nodiscard]] const std::vector<line_record> &records() const { return records_; }
    [[nodiscard]] const std::vector<finding> &findings() const { return findings_; }

    [[nodiscard]] std::size_t size() const { return records_.size(); }
    [[nodiscard]] bool empty() const { return records_.empty(); }

protected:
    std::vector<line_record> records_;
    std::vector<finding> findings_;
};

struct render_result {
    std::string redacted_text;
    std::vector<finding> findings;
};

} // namespace confscrub
