// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "luhngen.h"

const char* level_to_str(LUHNGEN_LOG_LEVEL level);
LUHNGEN_LOG_LEVEL str_to_level(std::string_view str);

void log_cb(LUHNGEN_LOG_LEVEL level, const char* function, const char* file,
    unsigned line, const char* message, uint64_t length);

std::string read_file(std::string_view filename);
