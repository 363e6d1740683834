// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>

#include "utils.hpp"

using namespace std::literals;

namespace confscrub {

namespace {

// Consumes a run of digits accepted by the predicate, underscores are only
// allowed between two digits. Returns the number of digits consumed.
template <typename Pred> std::size_t consume_digits(std::string_view &str, Pred &&is_valid)
{
    std::size_t count = 0;
    while (!str.empty()) {
        const char c = str.front();
        if (is_valid(c)) {
            ++count;
        } else if (c == '_' && count > 0 && str.size() > 1 && is_valid(str[1])) {
            // Separator, the next character is a digit
        } else {
            break;
        }
        str.remove_prefix(1);
    }
    return count;
}

} // namespace

std::string to_lower(std::string_view str)
{
    std::string lowered{str};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](char c) { return tolower(c); });
    return lowered;
}

bool string_iequals(std::string_view left, std::string_view right)
{
    return left.size() == right.size() &&
           std::equal(left.begin(), left.end(), right.begin(),
               [](char l, char r) { return tolower(l) == tolower(r); });
}

bool is_number(std::string_view str)
{
    if (!str.empty() && (str.front() == '+' || str.front() == '-')) {
        str.remove_prefix(1);
    }

    if (str == "inf"sv || str == "nan"sv) {
        return true;
    }

    if (str.size() > 2 && str[0] == '0') {
        auto prefix = tolower(str[1]);
        auto digits = str.substr(2);
        if (prefix == 'x') {
            return consume_digits(digits, [](char c) { return isxdigit(c); }) > 0 &&
                   digits.empty();
        }

        if (prefix == 'o') {
            return consume_digits(digits, [](char c) { return c >= '0' && c <= '7'; }) > 0 &&
                   digits.empty();
        }

        if (prefix == 'b') {
            return consume_digits(digits, [](char c) { return c == '0' || c == '1'; }) > 0 &&
                   digits.empty();
        }
    }

    auto is_decimal = [](char c) { return isdigit(c); };
    if (consume_digits(str, is_decimal) == 0) {
        return false;
    }

    if (!str.empty() && str.front() == '.') {
        str.remove_prefix(1);
        if (consume_digits(str, is_decimal) == 0) {
            return false;
        }
    }

    if (!str.empty() && tolower(str.front()) == 'e') {
        str.remove_prefix(1);
        if (!str.empty() && (str.front() == '+' || str.front() == '-')) {
            str.remove_prefix(1);
        }
        if (consume_digits(str, is_decimal) == 0) {
            return false;
        }
    }

    return str.empty();
}

} // namespace confscrub
