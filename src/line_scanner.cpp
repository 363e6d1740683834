// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "configuration.hpp"
#include "line_scanner.hpp"
#include "log.hpp"
#include "scan_result.hpp"
#include "utils.hpp"

using namespace std::literals;

namespace confscrub {

namespace {

struct section_header {
    std::string_view name;
    bool table_array{false};
};

struct key_value {
    std::string_view key;
    std::string_view value;
    // Relative to the parsed text
    std::size_t value_offset{0};
};

// Returns the position of the quote closing the string starting at begin,
// basic strings honour backslash escapes, literal strings don't.
std::size_t find_closing_quote(std::string_view text, std::size_t begin)
{
    const char quote = text[begin];
    for (std::size_t i = begin + 1; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\\' && quote == '"') {
            ++i;
        } else if (c == quote) {
            return i;
        }
    }
    return std::string_view::npos;
}

bool is_comment_or_empty(std::string_view text)
{
    text = trim_left(text);
    return text.empty() || text.front() == '#';
}

// A key is a dot-separated sequence of segments, each either bare or quoted
bool is_valid_key(std::string_view key)
{
    if (key.empty()) {
        return false;
    }

    std::size_t i = 0;
    while (true) {
        while (i < key.size() && isspace(key[i])) { ++i; }
        if (i >= key.size()) {
            return false;
        }

        if (isquote(key[i])) {
            auto end = find_closing_quote(key, i);
            if (end == std::string_view::npos) {
                return false;
            }
            i = end + 1;
        } else {
            const std::size_t begin = i;
            while (i < key.size() && isbarekey(key[i])) { ++i; }
            if (i == begin) {
                return false;
            }
        }

        while (i < key.size() && isspace(key[i])) { ++i; }
        if (i == key.size()) {
            return true;
        }

        if (key[i] != '.') {
            return false;
        }
        ++i;
    }
}

std::optional<section_header> parse_section_header(std::string_view text)
{
    text = trim_left(text);
    if (!text.starts_with('[')) {
        return std::nullopt;
    }

    const bool table_array = text.starts_with("[["sv);
    std::size_t pos = table_array ? 2 : 1;
    const std::size_t name_begin = pos;

    while (pos < text.size() && text[pos] != ']') {
        if (isquote(text[pos])) {
            pos = find_closing_quote(text, pos);
            if (pos == std::string_view::npos) {
                return std::nullopt;
            }
        }
        ++pos;
    }

    if (pos >= text.size()) {
        return std::nullopt;
    }

    auto name = trim(text.substr(name_begin, pos - name_begin));
    if (!is_valid_key(name)) {
        return std::nullopt;
    }

    ++pos;
    if (table_array) {
        if (pos >= text.size() || text[pos] != ']') {
            return std::nullopt;
        }
        ++pos;
    }

    if (!is_comment_or_empty(text.substr(pos))) {
        return std::nullopt;
    }

    return section_header{name, table_array};
}

std::optional<key_value> parse_key_value(std::string_view text)
{
    // Split on the first unquoted equal sign
    std::size_t equal = std::string_view::npos;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (isquote(c)) {
            i = find_closing_quote(text, i);
            if (i == std::string_view::npos) {
                return std::nullopt;
            }
        } else if (c == '=') {
            equal = i;
            break;
        } else if (c == '#') {
            return std::nullopt;
        }
    }

    if (equal == std::string_view::npos) {
        return std::nullopt;
    }

    auto key = trim(text.substr(0, equal));
    if (!is_valid_key(key)) {
        return std::nullopt;
    }

    std::size_t pos = equal + 1;
    while (pos < text.size() && isspace(text[pos])) { ++pos; }

    if (pos == text.size() || text[pos] == '#') {
        return key_value{key, {}, pos};
    }

    const char first = text[pos];
    if (isquote(first)) {
        const auto remaining = text.substr(pos);
        if (remaining.starts_with(R"(""")"sv) || remaining.starts_with("'''"sv)) {
            // Multi-line strings are unsupported
            return std::nullopt;
        }

        auto closing = find_closing_quote(text, pos);
        if (closing == std::string_view::npos || !is_comment_or_empty(text.substr(closing + 1))) {
            return std::nullopt;
        }

        return key_value{key, text.substr(pos + 1, closing - pos - 1), pos + 1};
    }

    if (first == '[' || first == '{') {
        // Arrays and inline tables are unsupported
        return std::nullopt;
    }

    auto end = text.find('#', pos);
    auto value = trim_right(text.substr(pos, end == std::string_view::npos ? end : end - pos));
    return key_value{key, value, pos};
}

} // namespace

scan_result line_scanner::scan(std::string_view document) const
{
    std::vector<line_record> records;
    std::optional<std::string> section;

    std::size_t start = 0;
    std::size_t number = 0;
    while (start < document.size()) {
        std::string_view text;
        std::string_view terminator;

        auto end = document.find('\n', start);
        if (end == std::string_view::npos) {
            text = document.substr(start);
            start = document.size();
        } else {
            text = document.substr(start, end - start);
            terminator = document.substr(end, 1);
            if (text.ends_with('\r')) {
                text.remove_suffix(1);
                terminator = document.substr(end - 1, 2);
            }
            start = end + 1;
        }

        records.emplace_back(scan_line(text, terminator, ++number, section));
    }

    scan_result result{std::move(records)};
    CONFSCRUB_DEBUG("scanned {} lines, {} sensitive", result.size(), result.findings().size());
    return result;
}

line_record line_scanner::scan_line(std::string_view text, std::string_view terminator,
    std::size_t number, std::optional<std::string> &section) const
{
    line_record record;
    record.text = text;
    record.terminator = terminator;
    record.number = number;

    auto content = trim_left(text);
    if (content.empty()) {
        record.kind = line_kind::blank;
        record.section = section;
        return record;
    }

    if (content.front() == '[') {
        auto header = parse_section_header(content);
        if (header.has_value()) {
            section = std::string{header->name};
            record.kind = header->table_array ? line_kind::table_array : line_kind::section;
        }
        record.section = section;
        return record;
    }

    record.section = section;

    // Offset, within the line, of the text parsed as a key/value pair
    std::size_t offset = text.size() - content.size();
    if (content.front() == '#') {
        record.kind = line_kind::comment;
        if (!config_.include_comments) {
            return record;
        }

        ++offset;
        content.remove_prefix(1);
    }

    auto kv = parse_key_value(content);
    if (!kv.has_value()) {
        return record;
    }

    if (record.kind != line_kind::comment) {
        record.kind = line_kind::key_value;
    }

    record.key = std::string{kv->key};
    record.value = std::string{kv->value};
    record.value_offset = offset + kv->value_offset;
    record.value_length = kv->value.size();

    classify(record);

    return record;
}

void line_scanner::classify(line_record &record) const
{
    // Nothing to redact
    if (!record.value.has_value() || record.value->empty()) {
        return;
    }

    auto by_name = config_.keys->classify(*record.key);
    if (by_name.sensitive) {
        record.sensitive = true;
        record.reason = match_reason::key_name;
        record.pattern = std::move(by_name.pattern);
    } else if (config_.check_values) {
        auto by_value = config_.values->classify(*record.value);
        if (by_value.sensitive) {
            record.sensitive = true;
            record.reason = match_reason::value_pattern;
            record.pattern = std::move(by_value.pattern);
        }
    }

    if (record.sensitive) {
        CONFSCRUB_TRACE("line {}: key '{}' flagged by {} ({})", record.number, *record.key,
            to_string(record.reason), record.pattern);
    }
}

scan_result scan(std::string_view document, const configuration &config)
{
    config.validate();
    return line_scanner{config}.scan(document);
}

} // namespace confscrub
