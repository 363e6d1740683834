// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <iterator>
#include <new>
#include <string_view>

#include <fmt/format.h>

#include "confscrub.h"

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define CONFSCRUB_LOG(level, fmt_str, ...)                                                         \
    do {                                                                                           \
        if (confscrub::logger::enabled(level)) {                                                   \
            constexpr auto confscrub_log_file = confscrub::source_file_name(__FILE__);             \
            confscrub::logger::emit(                                                               \
                level, __func__, confscrub_log_file.data(), __LINE__, fmt_str, ##__VA_ARGS__);     \
        }                                                                                          \
    } while (0)

#define CONFSCRUB_TRACE(fmt, ...) CONFSCRUB_LOG(CONFSCRUB_LOG_TRACE, fmt, ##__VA_ARGS__)
#define CONFSCRUB_DEBUG(fmt, ...) CONFSCRUB_LOG(CONFSCRUB_LOG_DEBUG, fmt, ##__VA_ARGS__)
#define CONFSCRUB_INFO(fmt, ...) CONFSCRUB_LOG(CONFSCRUB_LOG_INFO, fmt, ##__VA_ARGS__)
#define CONFSCRUB_WARN(fmt, ...) CONFSCRUB_LOG(CONFSCRUB_LOG_WARN, fmt, ##__VA_ARGS__)
#define CONFSCRUB_ERROR(fmt, ...) CONFSCRUB_LOG(CONFSCRUB_LOG_ERROR, fmt, ##__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace confscrub {

// Last path component, the result stays nul-terminated as it ends with path
constexpr std::string_view source_file_name(std::string_view path)
{
    auto separator = path.find_last_of("/\\");
    return separator == std::string_view::npos ? path : path.substr(separator + 1);
}

std::string_view log_level_to_str(CONFSCRUB_LOG_LEVEL level);

// Process-wide sink shared by every instance, configured through
// confscrub_set_log_cb and disabled until then.
class logger {
public:
    static void init(confscrub_log_cb cb, CONFSCRUB_LOG_LEVEL min_level);

    static bool enabled(CONFSCRUB_LOG_LEVEL level)
    {
        return cb_ != nullptr && level >= min_level_;
    }

    // Messages are dropped if formatting runs out of memory
    template <typename... Args>
    static void emit(CONFSCRUB_LOG_LEVEL level, const char *function, const char *file,
        unsigned line, fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        try {
            fmt::memory_buffer buffer;
            fmt::vformat_to(std::back_inserter(buffer), fmt::string_view{fmt_str},
                fmt::make_format_args(args...));
            const auto length = buffer.size();
            buffer.push_back('\0');
            write(level, function, file, line, buffer.data(), length);
        } catch (const std::bad_alloc &) {}
    }

protected:
    static void write(CONFSCRUB_LOG_LEVEL level, const char *function, const char *file,
        unsigned line, const char *message, std::size_t length);

    static confscrub_log_cb cb_;
    static CONFSCRUB_LOG_LEVEL min_level_;
};

} // namespace confscrub
