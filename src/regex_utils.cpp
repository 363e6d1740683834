// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include "exception.hpp"
#include "regex_utils.hpp"

namespace confscrub {

std::unique_ptr<re2::RE2> regex_init(std::string_view pattern, bool case_sensitive)
{
    constexpr int64_t regex_max_mem = 512 * 1024;

    re2::RE2::Options options;
    options.set_max_mem(regex_max_mem);
    options.set_log_errors(false);
    options.set_case_sensitive(case_sensitive);

    const re2::StringPiece pattern_ref(pattern.data(), pattern.size());
    auto regex = std::make_unique<re2::RE2>(pattern_ref, options);
    if (!regex->ok()) {
        throw invalid_configuration(
            "invalid regular expression (" + std::string(pattern) + "): " + regex->error());
    }
    return regex;
}

bool regex_match(const re2::RE2 &regex, std::string_view subject, re2::RE2::Anchor anchor)
{
    const re2::StringPiece subject_ref(subject.data(), subject.size());
    return regex.Match(subject_ref, 0, subject_ref.size(), anchor, nullptr, 0);
}

bool regex_search(const re2::RE2 &regex, std::string_view subject, std::string_view &match)
{
    const re2::StringPiece subject_ref(subject.data(), subject.size());
    re2::StringPiece submatch;
    if (!regex.Match(subject_ref, 0, subject_ref.size(), re2::RE2::UNANCHORED, &submatch, 1)) {
        return false;
    }

    match = std::string_view{submatch.data(), submatch.size()};
    return true;
}

std::string regex_alternation(std::span<const std::string_view> literals)
{
    std::string pattern{"(?:"};
    for (std::size_t i = 0; i < literals.size(); ++i) {
        if (i > 0) {
            pattern.push_back('|');
        }
        const re2::StringPiece literal_ref(literals[i].data(), literals[i].size());
        pattern.append(re2::RE2::QuoteMeta(literal_ref));
    }
    pattern.push_back(')');
    return pattern;
}

} // namespace confscrub
