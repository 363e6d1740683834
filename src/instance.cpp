// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string_view>
#include <utility>

#include "instance.hpp"
#include "line_scanner.hpp"
#include "redactor.hpp"

namespace confscrub {

instance::instance(configuration config) : config_(std::move(config)) { config_.validate(); }

scan_result instance::scan(std::string_view document) const
{
    return line_scanner{config_}.scan(document);
}

render_result instance::redact(std::string_view document) const
{
    return render(scan(document), config_);
}

} // namespace confscrub
