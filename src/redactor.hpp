// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include "configuration.hpp"
#include "scan_result.hpp"

namespace confscrub {

// Produces the redacted document and the findings of a scan. Only the value
// span of sensitive records is replaced, every other byte is copied as is.
// Validates the configuration, throws invalid_configuration.
render_result render(const scan_result &result, const configuration &config);

} // namespace confscrub
