// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "checksum/luhn_checksum.hpp"
#include "exception.hpp"
#include "utils.hpp"

namespace luhngen {

namespace {

// Sum of the digits modulo 10, doubling every other one starting with the
// rightmost digit when double_first is set, or with the one before it otherwise.
uint32_t luhn_sum(std::string_view str, bool double_first)
{
    // Precomputed doubled values
    //   for num from 0 to 9: (2 * num) / 10 + (2 * num) % 10
    static constexpr std::array<uint8_t, 10> lut = {0, 2, 4, 6, 8, 1, 3, 5, 7, 9};

    if (str.empty()) {
        throw invalid_input("empty digit string");
    }

    uint32_t sum = 0;
    bool should_double = double_first;
    for (std::size_t i = str.size(); i > 0; --i) {
        const auto c = str[i - 1];
        if (!luhngen::isdigit(c)) {
            throw invalid_input("non-digit character at position " + std::to_string(i - 1));
        }

        const auto d = static_cast<uint32_t>(c - '0');
        sum += should_double ? lut[d] : d;
        // Kept below 10 so inputs of any length can't wrap the sum
        if (sum >= 10U) {
            sum -= 10U;
        }
        should_double = !should_double;
    }

    return sum;
}

} // namespace

char luhn_checksum::check_digit(std::string_view prefix) const
{
    // The check digit goes to the right of the prefix, so the last digit of
    // the prefix is the first one to be doubled.
    const auto sum = luhn_sum(prefix, true);
    return static_cast<char>('0' + ((10U - (sum % 10U)) % 10U));
}

bool luhn_checksum::validate(std::string_view str) const
{
    return luhn_sum(str, false) % 10U == 0U;
}

} // namespace luhngen
