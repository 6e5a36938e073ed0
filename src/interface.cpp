// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstdint>
#include <exception>
#include <string_view>

#include "checksum/luhn_checksum.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "luhngen.h"
#include "version.hpp"

using namespace luhngen;

// Log level compatibility
static_assert(static_cast<uint32_t>(log_level::trace) == LUHNGEN_LOG_TRACE);
static_assert(static_cast<uint32_t>(log_level::debug) == LUHNGEN_LOG_DEBUG);
static_assert(static_cast<uint32_t>(log_level::info) == LUHNGEN_LOG_INFO);
static_assert(static_cast<uint32_t>(log_level::warn) == LUHNGEN_LOG_WARN);
static_assert(static_cast<uint32_t>(log_level::error) == LUHNGEN_LOG_ERROR);
static_assert(static_cast<uint32_t>(log_level::off) == LUHNGEN_LOG_OFF);

extern "C" {

LUHNGEN_RET_CODE luhngen_compute_check_digit(const char *prefix, uint32_t length, char *check_digit)
{
    if (prefix == nullptr || length == 0 || check_digit == nullptr) {
        LUHNGEN_WARN("Invalid argument provided to luhngen_compute_check_digit");
        return LUHNGEN_ERR_INVALID_ARGUMENT;
    }

    try {
        *check_digit = luhn_checksum{}.check_digit(std::string_view{prefix, length});
        return LUHNGEN_OK;
    } catch (const invalid_input &e) {
        LUHNGEN_DEBUG("{}", e.what());
        return LUHNGEN_ERR_INVALID_ARGUMENT;
    } catch (const std::exception &e) {
        LUHNGEN_ERROR("{}", e.what());
    } catch (...) {
        LUHNGEN_ERROR("unknown exception");
    }

    return LUHNGEN_ERR_INTERNAL;
}

LUHNGEN_RET_CODE luhngen_validate(const char *number, uint32_t length)
{
    if (number == nullptr || length == 0) {
        LUHNGEN_WARN("Invalid argument provided to luhngen_validate");
        return LUHNGEN_ERR_INVALID_ARGUMENT;
    }

    try {
        return luhn_checksum{}.validate(std::string_view{number, length})
                   ? LUHNGEN_OK
                   : LUHNGEN_CHECKSUM_MISMATCH;
    } catch (const invalid_input &e) {
        LUHNGEN_DEBUG("{}", e.what());
        return LUHNGEN_ERR_INVALID_ARGUMENT;
    } catch (const std::exception &e) {
        LUHNGEN_ERROR("{}", e.what());
    } catch (...) {
        LUHNGEN_ERROR("unknown exception");
    }

    return LUHNGEN_ERR_INTERNAL;
}

const char *luhngen_get_version() { return current_version; }

bool luhngen_set_log_cb(luhngen_log_cb cb, LUHNGEN_LOG_LEVEL min_level)
{
    luhngen::logger::init(cb, static_cast<log_level>(min_level));
    LUHNGEN_INFO("Sending log messages to binding, min level {}",
        log_level_to_str(static_cast<log_level>(min_level)));
    return true;
}

} // extern "C"
