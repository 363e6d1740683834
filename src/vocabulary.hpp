// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <array>
#include <cstddef>
#include <string_view>

// Built-in classification tables, all entries are lowercase as keys are
// normalised before being compared.
namespace confscrub::vocabulary {

// Matched anywhere within the normalised key
inline constexpr std::array<std::string_view, 16> sensitive_terms{"password", "passwd", "pwd",
    "key", "apikey", "api_key", "secret", "credential", "credentials", "auth_token",
    "access_token", "refresh_token", "bearer_token", "key_password", "moesifkey",
    "embedding_endpoint_key"};

// "token" on its own is too common a word, only whole-word uses count
inline constexpr std::array<std::string_view, 3> token_patterns{
    R"(\btoken\b)", R"(_token$)", R"(^token_)"};

// Keys configuring a behaviour rather than holding a secret
inline constexpr std::array<std::string_view, 10> exclusion_prefixes{"allow_", "enable_",
    "disable_", "show_", "display_", "retain_", "is_", "has_", "max_", "min_"};

inline constexpr std::array<std::string_view, 13> exclusion_suffixes{"_timeout", "_ttl",
    "_period", "_validity_period", "_interval", "_time", "_expiry", "_size", "_pool_size",
    "_count", "_length", "_limit", "_threads"};

// Well-known prefixes of issued API keys and tokens
inline constexpr std::array<std::string_view, 14> secret_value_prefixes{"sk-", "sk_live_",
    "sk_test_", "rk_live_", "pk_live_", "ghp_", "gho_", "ghs_", "ghu_", "github_pat_", "xoxb-",
    "xoxp-", "glpat-", "AKIA"};

// A JWT header always starts with the base64 encoding of `{"`
inline constexpr std::string_view jwt_prefix{"eyJ"};

inline constexpr std::size_t base64_min_length = 40;
inline constexpr std::size_t api_key_min_length = 20;

} // namespace confscrub::vocabulary
