// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <memory>
#include <re2/re2.h>
#include <string>
#include <string_view>

#include "classifier/base.hpp"

namespace confscrub {

// Decides from the key name alone whether a value is a secret. Exclusion
// rules take priority over the sensitive vocabulary: `max_token_size` is
// excluded even though it mentions a token.
//
// Instances are immutable once built and can be shared between threads.
class key_classifier {
public:
    // Optional expressions extend the built-in tables, both are matched
    // case-insensitively against the normalised key.
    explicit key_classifier(std::string_view extra_key_regex_str = std::string_view(),
        std::string_view extra_exclusion_regex_str = std::string_view());
    ~key_classifier() = default;
    key_classifier(const key_classifier &) = delete;
    key_classifier(key_classifier &&) noexcept = default;
    key_classifier &operator=(const key_classifier &) = delete;
    key_classifier &operator=(key_classifier &&) noexcept = default;

    [[nodiscard]] classification classify(std::string_view key) const;

    [[nodiscard]] bool is_excluded(std::string_view key) const;

    // Quotes are dropped (so `a."B"` becomes `a.b`) and the key is lowercased
    static std::string normalize(std::string_view key);

    static std::shared_ptr<const key_classifier> default_instance();

protected:
    [[nodiscard]] bool is_excluded_normalized(std::string_view key) const;

    std::unique_ptr<re2::RE2> exclusion_regex_{nullptr};
    std::unique_ptr<re2::RE2> name_regex_{nullptr};
    std::unique_ptr<re2::RE2> extra_exclusion_regex_{nullptr};
    std::unique_ptr<re2::RE2> extra_name_regex_{nullptr};
};

} // namespace confscrub
