// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "classifier/key_classifier.hpp"
#include "log.hpp"
#include "regex_utils.hpp"
#include "utils.hpp"
#include "vocabulary.hpp"

namespace confscrub {

namespace {

std::string build_exclusion_regex()
{
    return "^" + regex_alternation(vocabulary::exclusion_prefixes) + "|" +
           regex_alternation(vocabulary::exclusion_suffixes) + "$";
}

std::string build_name_regex()
{
    // Longer terms first, so that the reported term is the most specific one
    // starting at the leftmost match position, e.g. api_key rather than key.
    std::vector<std::string_view> terms{
        vocabulary::sensitive_terms.begin(), vocabulary::sensitive_terms.end()};
    std::stable_sort(terms.begin(), terms.end(),
        [](std::string_view l, std::string_view r) { return l.size() > r.size(); });

    std::string pattern = regex_alternation(terms);
    for (auto token : vocabulary::token_patterns) {
        pattern.push_back('|');
        pattern.append(token);
    }
    return pattern;
}

} // namespace

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
key_classifier::key_classifier(
    std::string_view extra_key_regex_str, std::string_view extra_exclusion_regex_str)
    : exclusion_regex_(regex_init(build_exclusion_regex())),
      name_regex_(regex_init(build_name_regex()))
{
    if (!extra_key_regex_str.empty()) {
        extra_name_regex_ = regex_init(extra_key_regex_str);
        CONFSCRUB_DEBUG("additional sensitive key regex: {}", extra_key_regex_str);
    }

    if (!extra_exclusion_regex_str.empty()) {
        extra_exclusion_regex_ = regex_init(extra_exclusion_regex_str);
        CONFSCRUB_DEBUG("additional key exclusion regex: {}", extra_exclusion_regex_str);
    }
}

std::string key_classifier::normalize(std::string_view key)
{
    auto normalized = to_lower(key);
    std::erase_if(normalized, [](char c) { return isquote(c); });
    return normalized;
}

bool key_classifier::is_excluded(std::string_view key) const
{
    return is_excluded_normalized(normalize(key));
}

bool key_classifier::is_excluded_normalized(std::string_view key) const
{
    if (regex_match(*exclusion_regex_, key)) {
        return true;
    }

    return extra_exclusion_regex_ && regex_match(*extra_exclusion_regex_, key);
}

classification key_classifier::classify(std::string_view key) const
{
    auto normalized = normalize(key);
    if (normalized.empty() || is_excluded_normalized(normalized)) {
        return {};
    }

    std::string_view term;
    if (regex_search(*name_regex_, normalized, term)) {
        return {true, std::string{term}};
    }

    if (extra_name_regex_ && regex_search(*extra_name_regex_, normalized, term)) {
        return {true, std::string{term}};
    }

    return {};
}

std::shared_ptr<const key_classifier> key_classifier::default_instance()
{
    static const std::shared_ptr<const key_classifier> instance =
        std::make_shared<const key_classifier>();
    return instance;
}

} // namespace confscrub
