// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <string_view>

#include "log.hpp"

namespace confscrub {

confscrub_log_cb logger::cb_ = nullptr;
CONFSCRUB_LOG_LEVEL logger::min_level_ = CONFSCRUB_LOG_OFF;

std::string_view log_level_to_str(CONFSCRUB_LOG_LEVEL level)
{
    switch (level) {
    case CONFSCRUB_LOG_TRACE:
        return "trace";
    case CONFSCRUB_LOG_DEBUG:
        return "debug";
    case CONFSCRUB_LOG_INFO:
        return "info";
    case CONFSCRUB_LOG_WARN:
        return "warn";
    case CONFSCRUB_LOG_ERROR:
        return "error";
    case CONFSCRUB_LOG_OFF:
        break;
    }
    return "off";
}

void logger::init(confscrub_log_cb cb, CONFSCRUB_LOG_LEVEL min_level)
{
    cb_ = cb;
    min_level_ = min_level;
}

void logger::write(CONFSCRUB_LOG_LEVEL level, const char *function, const char *file,
    unsigned line, const char *message, std::size_t length)
{
    cb_(level, function, file, line, message, length);
}

} // namespace confscrub
