// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string_view>
#include <utility>
#include <vector>

#include "scan_result.hpp"

namespace confscrub {

std::string_view to_string(line_kind kind)
{
    switch (kind) {
    case line_kind::blank:
        return "blank";
    case line_kind::comment:
        return "comment";
    case line_kind::section:
        return "section";
    case line_kind::table_array:
        return "table_array";
    case line_kind::key_value:
        return "key_value";
    case line_kind::opaque:
        break;
    }
    return "opaque";
}

std::string_view to_string(match_reason reason)
{
    switch (reason) {
    case match_reason::key_name:
        return "key_name";
    case match_reason::value_pattern:
        return "value_pattern";
    case match_reason::none:
        break;
    }
    return "none";
}

scan_result::scan_result(std::vector<line_record> records) : records_(std::move(records))
{
    for (const auto &record : records_) {
        if (!record.sensitive) {
            continue;
        }

        findings_.emplace_back(finding{.line = record.number,
            .section = record.section,
            .key = record.key.value_or(std::string{}),
            .reason = record.reason,
            .pattern = record.pattern,
            .commented = record.is_comment()});
    }
}

} // namespace confscrub
