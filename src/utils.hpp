// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace confscrub {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
inline bool isalpha(char c) { return (static_cast<unsigned>(c) | 32) - 'a' < 26; }
inline bool isdigit(char c) { return static_cast<unsigned>(c) - '0' < 10; }
inline bool isxdigit(char c) { return isdigit(c) || ((unsigned)c | 32) - 'a' < 6; }
inline bool isspace(char c)
{
    return c == ' ' || c == '\f' || c == '\n' || c == '\r' || c == '\t' || c == '\v';
}
inline bool isupper(char c) { return static_cast<unsigned>(c) - 'A' < 26; }
inline bool islower(char c) { return static_cast<unsigned>(c) - 'a' < 26; }
inline bool isalnum(char c) { return isalpha(c) || isdigit(c); }
inline char tolower(char c) { return isupper(c) ? static_cast<char>(c | 32) : c; }
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

// Characters allowed in an unquoted key segment
inline bool isbarekey(char c) { return isalnum(c) || c == '_' || c == '-'; }
inline bool isquote(char c) { return c == '"' || c == '\''; }

inline std::string_view trim_left(std::string_view str)
{
    while (!str.empty() && isspace(str.front())) { str.remove_prefix(1); }
    return str;
}

inline std::string_view trim_right(std::string_view str)
{
    while (!str.empty() && isspace(str.back())) { str.remove_suffix(1); }
    return str;
}

inline std::string_view trim(std::string_view str) { return trim_right(trim_left(str)); }

std::string to_lower(std::string_view str);

bool string_iequals(std::string_view left, std::string_view right);

// Integers (decimal with optional underscores, hex, octal, binary), floats
// with fraction and/or exponent, and the inf / nan literals.
bool is_number(std::string_view str);

} // namespace confscrub
