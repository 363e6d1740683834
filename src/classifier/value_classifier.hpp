// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <memory>
#include <re2/re2.h>
#include <string_view>

#include "classifier/base.hpp"

namespace confscrub {

// Decides from the value alone whether it has the shape of a secret: a JWT,
// a long base64 blob or an API key. The rules are independent and the first
// one matching, in that order, is reported.
class value_classifier {
public:
    static constexpr std::string_view jwt_pattern{"jwt"};
    static constexpr std::string_view base64_pattern{"base64"};
    static constexpr std::string_view api_key_pattern{"api_key"};
    static constexpr std::string_view custom_pattern{"custom"};

    // The optional expression is matched case-sensitively against the value
    explicit value_classifier(std::string_view extra_value_regex_str = std::string_view());
    ~value_classifier() = default;
    value_classifier(const value_classifier &) = delete;
    value_classifier(value_classifier &&) noexcept = default;
    value_classifier &operator=(const value_classifier &) = delete;
    value_classifier &operator=(value_classifier &&) noexcept = default;

    [[nodiscard]] classification classify(std::string_view value) const;

    // Booleans, numbers and $VARIABLE references hold no secret themselves
    static bool is_placeholder(std::string_view value);

    // A contiguous alphanumeric run mixing at least two of upper case, lower
    // case and digits
    static bool is_mixed_alnum_token(std::string_view value);

    static std::shared_ptr<const value_classifier> default_instance();

protected:
    std::unique_ptr<re2::RE2> base64_regex_{nullptr};
    std::unique_ptr<re2::RE2> prefix_regex_{nullptr};
    std::unique_ptr<re2::RE2> extra_regex_{nullptr};
};

} // namespace confscrub
