// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <iostream>

#include "common/cli.hpp"
#include "common/utils.hpp"
#include "confscrub.h"

int main(int argc, char *argv[])
{
    auto args = parse_args(argc, argv);

    // Library logs share stderr with the reports, never stdout
    confscrub_set_log_cb(
        log_cb, args.contains("--verbose") ? CONFSCRUB_LOG_TRACE : CONFSCRUB_LOG_OFF);

    return run(argv[0], args, std::cout, std::cerr);
}
