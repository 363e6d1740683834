// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string>

namespace confscrub {

// Verdict of a single classifier, pattern holds the vocabulary term or value
// shape responsible for the match.
struct classification {
    bool sensitive{false};
    std::string pattern{};
};

} // namespace confscrub
