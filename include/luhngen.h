// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#ifndef LUHNGEN_H
#define LUHNGEN_H

#ifdef __cplusplus
extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @enum LUHNGEN_RET_CODE
 *
 * Codes returned by the checksum functions.
 **/
typedef enum
{
    LUHNGEN_ERR_INTERNAL         = -2,
    LUHNGEN_ERR_INVALID_ARGUMENT = -1,
    LUHNGEN_OK                   = 0,
    LUHNGEN_CHECKSUM_MISMATCH    = 1,
} LUHNGEN_RET_CODE;

/**
 * @enum LUHNGEN_LOG_LEVEL
 *
 * Internal log levels, to be used when setting the minimum log level and cb.
 **/
typedef enum
{
    LUHNGEN_LOG_TRACE,
    LUHNGEN_LOG_DEBUG,
    LUHNGEN_LOG_INFO,
    LUHNGEN_LOG_WARN,
    LUHNGEN_LOG_ERROR,
    LUHNGEN_LOG_OFF,
} LUHNGEN_LOG_LEVEL;

/**
 * @typedef luhngen_log_cb
 *
 * Callback that the library will call to relay messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emitted the message. (nonnull)
 * @param line The line where the message was emitted.
 * @param message The logging message. NUL-terminated
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*luhngen_log_cb)(
    LUHNGEN_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * luhngen_compute_check_digit
 *
 * Computes the Luhn check digit which, appended to the prefix, produces a
 * number that passes the Luhn validation.
 *
 * @param prefix Digits of the number without its check digit. (nonnull)
 * @param length Length of the prefix, must be greater than zero.
 * @param check_digit Output character receiving the check digit ('0'-'9'). (nonnull)
 *
 * @return LUHNGEN_OK on success, LUHNGEN_ERR_INVALID_ARGUMENT if the prefix
 *         is empty or contains a character outside '0'-'9'.
 **/
LUHNGEN_RET_CODE luhngen_compute_check_digit(const char *prefix, uint32_t length, char *check_digit);

/**
 * luhngen_validate
 *
 * Validates a complete number, including its check digit, against the Luhn
 * checksum.
 *
 * @param number Digits of the number. (nonnull)
 * @param length Length of the number, must be greater than zero.
 *
 * @return LUHNGEN_OK if the checksum holds, LUHNGEN_CHECKSUM_MISMATCH if it
 *         doesn't, LUHNGEN_ERR_INVALID_ARGUMENT if the number is empty or
 *         contains a character outside '0'-'9'.
 **/
LUHNGEN_RET_CODE luhngen_validate(const char *number, uint32_t length);

/**
 * luhngen_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *luhngen_get_version();

/**
 * luhngen_set_log_cb
 *
 * Sets the callback to relay logging messages to the binding
 *
 * @param cb The callback to call, or NULL to stop relaying messages
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 *
 * @note This function is not thread-safe
 **/
bool luhngen_set_log_cb(luhngen_log_cb cb, LUHNGEN_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /*LUHNGEN_H */
