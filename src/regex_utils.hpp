// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <memory>
#include <re2/re2.h>
#include <span>
#include <string>
#include <string_view>

namespace confscrub {

// Throws invalid_configuration if the pattern doesn't compile
std::unique_ptr<re2::RE2> regex_init(std::string_view pattern, bool case_sensitive = false);

bool regex_match(const re2::RE2 &regex, std::string_view subject,
    re2::RE2::Anchor anchor = re2::RE2::UNANCHORED);

// Unanchored search, on success the matched substring is stored in match
bool regex_search(const re2::RE2 &regex, std::string_view subject, std::string_view &match);

// Builds "(?:a|b|c)" with every alternative quoted literally
std::string regex_alternation(std::span<const std::string_view> literals);

} // namespace confscrub
