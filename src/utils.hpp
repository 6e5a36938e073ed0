// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <algorithm>
#include <cstdint>
#include <string_view>
#include <utility>

namespace luhngen {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
inline bool isdigit(char c) { return static_cast<unsigned>(c) - '0' < 10; }
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

// Non-empty and made only of '0'-'9'
inline bool is_digit_string(std::string_view str)
{
    return !str.empty() && std::all_of(str.begin(), str.end(), [](char c) { return isdigit(c); });
}

template <typename T> std::pair<bool, T> from_string(std::string_view str);

// Calendar year of the system clock, in UTC
unsigned current_year();

} // namespace luhngen
