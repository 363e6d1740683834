// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

constexpr int exit_clean = 0;
constexpr int exit_findings = 1;
constexpr int exit_error = 2;

// Long option name to the values given, positionals are stored under
// "--input", unrecognised options under "--unknown" and options missing
// their value under "--missing-value".
using cli_arguments = std::unordered_map<std::string, std::vector<std::string>>;

cli_arguments parse_args(int argc, const char *const argv[]);

void print_usage(std::string_view program, std::ostream &out);

// Processes every input and returns the exit status: exit_clean without
// findings, exit_findings when at least one input holds sensitive data and
// exit_error on usage, configuration or I/O errors, the latter winning.
int run(std::string_view program, const cli_arguments &args, std::ostream &out,
    std::ostream &err);
