// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <memory>
#include <string_view>

#include "configuration.hpp"
#include "exception.hpp"

namespace confscrub {

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
void configuration::set_patterns(
    std::string_view key_regex, std::string_view exclusion_regex, std::string_view value_regex)
{
    if (!key_regex.empty() || !exclusion_regex.empty()) {
        keys = std::make_shared<const key_classifier>(key_regex, exclusion_regex);
    }

    if (!value_regex.empty()) {
        values = std::make_shared<const value_classifier>(value_regex);
    }
}

void configuration::validate() const
{
    if (redaction_marker.empty()) {
        throw invalid_configuration("empty redaction marker");
    }

    if (redaction_marker.find_first_of("\r\n") != std::string::npos) {
        throw invalid_configuration("redaction marker contains a line break");
    }

    if (!keys || !values) {
        throw invalid_configuration("missing classifier");
    }
}

} // namespace confscrub
