// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <exception>
#include <string>
#include <utility>

namespace confscrub {

// Raised before any scanning takes place when the configuration can't be used,
// document contents never produce exceptions.
class invalid_configuration : public std::exception {
public:
    explicit invalid_configuration(std::string what) : what_(std::move(what)) {}
    [[nodiscard]] const char *what() const noexcept override { return what_.c_str(); }

protected:
    std::string what_;
};

} // namespace confscrub
