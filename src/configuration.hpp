// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "classifier/key_classifier.hpp"
#include "classifier/value_classifier.hpp"

namespace confscrub {

struct configuration {
    static constexpr std::string_view default_redaction_marker{"***REDACTED***"};

    std::string redaction_marker{default_redaction_marker};
    // Inspect values in addition to key names
    bool check_values{true};
    // Parse commented-out lines as key/value pairs and classify them
    bool include_comments{false};
    // Drop comment lines from the rendered output
    bool remove_comments{false};

    std::shared_ptr<const key_classifier> keys{key_classifier::default_instance()};
    std::shared_ptr<const value_classifier> values{value_classifier::default_instance()};

    // Replaces the classifiers with ones extended by the given expressions,
    // empty expressions leave the built-in tables untouched.
    void set_patterns(std::string_view key_regex, std::string_view exclusion_regex,
        std::string_view value_regex);

    // Throws invalid_configuration
    void validate() const;
};

} // namespace confscrub
