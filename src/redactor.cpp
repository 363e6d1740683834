// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <string>
#include <utility>

#include "configuration.hpp"
#include "log.hpp"
#include "redactor.hpp"
#include "scan_result.hpp"

namespace confscrub {

render_result render(const scan_result &result, const configuration &config)
{
    config.validate();

    std::size_t estimated_size = 0;
    for (const auto &record : result.records()) {
        estimated_size += record.text.size() + record.terminator.size();
    }

    std::string output;
    output.reserve(estimated_size);

    std::size_t removed = 0;
    for (const auto &record : result.records()) {
        if (config.remove_comments && record.is_comment()) {
            ++removed;
            continue;
        }

        if (record.sensitive) {
            output.append(record.text, 0, record.value_offset);
            output.append(config.redaction_marker);
            output.append(record.text, record.value_offset + record.value_length);
        } else {
            output.append(record.text);
        }
        output.append(record.terminator);
    }

    CONFSCRUB_DEBUG("redacted {} values, removed {} comment lines", result.findings().size(),
        removed);

    return {std::move(output), result.findings()};
}

} // namespace confscrub
