// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "common/gtest_utils.hpp"
#include "luhngen.h"

using namespace std::literals;

const char *level_to_str(LUHNGEN_LOG_LEVEL level)
{
    switch (level) {
    case LUHNGEN_LOG_TRACE:
        return "trace";
    case LUHNGEN_LOG_DEBUG:
        return "debug";
    case LUHNGEN_LOG_ERROR:
        return "error";
    case LUHNGEN_LOG_WARN:
        return "warn";
    case LUHNGEN_LOG_INFO:
        return "info";
    case LUHNGEN_LOG_OFF:
        break;
    }

    return "off";
}

LUHNGEN_LOG_LEVEL str_to_level(std::string_view str)
{
    if (str == "trace"sv || str == "TRACE"sv) {
        return LUHNGEN_LOG_TRACE;
    }

    if (str == "debug"sv || str == "DEBUG"sv) {
        return LUHNGEN_LOG_DEBUG;
    }

    if (str == "error"sv || str == "ERROR"sv) {
        return LUHNGEN_LOG_ERROR;
    }

    if (str == "warn"sv || str == "WARN"sv) {
        return LUHNGEN_LOG_WARN;
    }

    if (str == "info"sv || str == "INFO"sv) {
        return LUHNGEN_LOG_INFO;
    }

    return LUHNGEN_LOG_OFF;
}

void log_cb(LUHNGEN_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, [[maybe_unused]] uint64_t len)
{
    fmt::print("[{}][{}:{}:{}]: {}\n", level_to_str(level), file, function, line, message);
}

// NOLINTNEXTLINE(modernize-avoid-c-arrays)
LUHNGEN_LOG_LEVEL find_log_level(int argc, char *argv[])
{
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    auto *env_level = getenv("LUHNGEN_TEST_LOG_LEVEL");
    if (env_level != nullptr) {
        return str_to_level(env_level);
    }

    LUHNGEN_LOG_LEVEL level = LUHNGEN_LOG_TRACE;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log_level" || arg == "--log-level") {
            if (i + 1 < argc) {
                level = str_to_level(argv[i + 1]);
            }
            break;
        }
    }
    return level;
}

int main(int argc, char *argv[])
{
    luhngen_set_log_cb(log_cb, find_log_level(argc, argv));

    testing::InitGoogleTest(&argc, argv);

    return RUN_ALL_TESTS() == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
