// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <charconv>
#include <chrono>
#include <cstdint>
#include <string_view>
#include <system_error>
#include <utility>

#include "utils.hpp"

namespace luhngen {

template <typename T> std::pair<bool, T> from_string(std::string_view str)
{
    T result{};
    const auto *end = str.data() + str.size();
    auto [endConv, err] = std::from_chars(str.data(), end, result);
    if (err == std::errc{} && endConv == end) {
        return {true, result};
    }

    return {false, {}};
}

unsigned current_year()
{
    const auto today = std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
    const std::chrono::year_month_day ymd{today};
    return static_cast<unsigned>(static_cast<int>(ymd.year()));
}

template std::pair<bool, unsigned> from_string<unsigned>(std::string_view str);
template std::pair<bool, uint64_t> from_string<uint64_t>(std::string_view str);

} // namespace luhngen
