// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cerrno>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>

#include "common/utils.hpp"

using namespace std::literals;

const char* level_to_str(LUHNGEN_LOG_LEVEL level)
{
    switch (level)
    {
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

void log_cb(LUHNGEN_LOG_LEVEL level,
            const char* function, const char* file, unsigned line,
            const char* message, uint64_t  /*length*/)
{
    std::cerr << "[" << level_to_str(level)
              << "][" << file
              << ":" << function
              << ":" << line
              << "]: " << message
              << '\n';
}

std::string read_file(std::string_view filename)
{
    std::ifstream input_file(std::string{filename}, std::ios::in);
    if (!input_file)
    {
        throw std::system_error(errno, std::generic_category());
    }

    // Create a buffer equal to the file size
    std::string buffer;
    input_file.seekg(0, std::ios::end);
    buffer.resize(input_file.tellg());
    input_file.seekg(0, std::ios::beg);

    input_file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    input_file.close();
    return buffer;
}
