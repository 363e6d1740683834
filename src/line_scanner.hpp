// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "configuration.hpp"
#include "scan_result.hpp"

namespace confscrub {

// Walks a document line by line without a full grammar. The only state
// carried from one line to the next is the current section, so anything that
// would need more (multi-line strings, arrays spanning lines) is recorded as
// an opaque line and left untouched.
class line_scanner {
public:
    // The configuration must outlive the scanner
    explicit line_scanner(const configuration &config) : config_(config) {}

    [[nodiscard]] scan_result scan(std::string_view document) const;

protected:
    [[nodiscard]] line_record scan_line(std::string_view text, std::string_view terminator,
        std::size_t number, std::optional<std::string> &section) const;

    void classify(line_record &record) const;

    const configuration &config_;
};

// Validates the configuration, throws invalid_configuration
scan_result scan(std::string_view document, const configuration &config);

} // namespace confscrub
