// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <memory>
#include <string>
#include <string_view>

#include "classifier/value_classifier.hpp"
#include "log.hpp"
#include "regex_utils.hpp"
#include "utils.hpp"
#include "vocabulary.hpp"

using namespace std::literals;

namespace confscrub {

namespace {

std::string_view strip_quotes(std::string_view value)
{
    if (value.size() >= 2 && isquote(value.front()) && value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

} // namespace

value_classifier::value_classifier(std::string_view extra_value_regex_str)
    : base64_regex_(regex_init(
          "^[A-Za-z0-9+/=]{" + std::to_string(vocabulary::base64_min_length) + ",}$", true)),
      prefix_regex_(regex_init("^" + regex_alternation(vocabulary::secret_value_prefixes), true))
{
    if (!extra_value_regex_str.empty()) {
        extra_regex_ = regex_init(extra_value_regex_str, true);
        CONFSCRUB_DEBUG("additional sensitive value regex: {}", extra_value_regex_str);
    }
}

bool value_classifier::is_placeholder(std::string_view value)
{
    if (value.starts_with('$')) {
        return true;
    }

    if (string_iequals(value, "true"sv) || string_iequals(value, "false"sv)) {
        return true;
    }

    return is_number(value);
}

bool value_classifier::is_mixed_alnum_token(std::string_view value)
{
    if (value.size() < vocabulary::api_key_min_length) {
        return false;
    }

    bool upper = false;
    bool lower = false;
    bool digit = false;
    for (auto c : value) {
        if (isupper(c)) {
            upper = true;
        } else if (islower(c)) {
            lower = true;
        } else if (isdigit(c)) {
            digit = true;
        } else {
            return false;
        }
    }

    return static_cast<int>(upper) + static_cast<int>(lower) + static_cast<int>(digit) >= 2;
}

classification value_classifier::classify(std::string_view value) const
{
    value = strip_quotes(value);
    if (value.empty() || is_placeholder(value)) {
        return {};
    }

    if (value.starts_with(vocabulary::jwt_prefix)) {
        return {true, std::string{jwt_pattern}};
    }

    if (regex_match(*base64_regex_, value)) {
        return {true, std::string{base64_pattern}};
    }

    if (regex_match(*prefix_regex_, value) || is_mixed_alnum_token(value)) {
        return {true, std::string{api_key_pattern}};
    }

    if (extra_regex_ && regex_match(*extra_regex_, value)) {
        return {true, std::string{custom_pattern}};
    }

    return {};
}

std::shared_ptr<const value_classifier> value_classifier::default_instance()
{
    static const std::shared_ptr<const value_classifier> instance =
        std::make_shared<const value_classifier>();
    return instance;
}

} // namespace confscrub
