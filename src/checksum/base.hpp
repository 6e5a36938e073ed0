// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

namespace luhngen {

// Check digit scheme over strings of decimal digits. Implementations throw
// invalid_input on an empty string or on any character outside '0'-'9'.
class base_checksum {
public:
    base_checksum() = default;
    base_checksum(const base_checksum &) = default;
    base_checksum &operator=(const base_checksum &) = default;
    base_checksum(base_checksum &&) = default;
    base_checksum &operator=(base_checksum &&) = default;
    virtual ~base_checksum() = default;

    // Digit which, appended to the prefix, yields a valid number
    [[nodiscard]] virtual char check_digit(std::string_view prefix) const = 0;
    // Whether the full number, check digit included, passes the checksum
    [[nodiscard]] virtual bool validate(std::string_view str) const = 0;

    [[nodiscard]] std::string complete(std::string_view prefix) const
    {
        const char digit = check_digit(prefix);

        std::string result;
        result.reserve(prefix.size() + 1);
        result.append(prefix);
        result.push_back(digit);
        return result;
    }
};

} // namespace luhngen
