// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string_view>

#include "configuration.hpp"
#include "scan_result.hpp"

namespace confscrub {

// A validated configuration bound to its compiled classifiers, shared by
// every document processed through the C interface.
class instance {
public:
    // Throws invalid_configuration
    explicit instance(configuration config);
    ~instance() = default;
    instance(const instance &) = delete;
    instance(instance &&) = delete;
    instance &operator=(const instance &) = delete;
    instance &operator=(instance &&) = delete;

    [[nodiscard]] scan_result scan(std::string_view document) const;
    [[nodiscard]] render_result redact(std::string_view document) const;

    [[nodiscard]] const configuration &config() const { return config_; }

protected:
    configuration config_;
};

} // namespace confscrub
