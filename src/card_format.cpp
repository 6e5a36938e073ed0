// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "card_format.hpp"

namespace luhngen {

std::string format_card_number(std::string_view number)
{
    static constexpr std::size_t group_size = 4;

    std::string result;
    result.reserve(number.size() + number.size() / group_size);
    for (std::size_t i = 0; i < number.size(); ++i) {
        if (i > 0 && i % group_size == 0) {
            result.push_back(' ');
        }
        result.push_back(number[i]);
    }
    return result;
}

std::string normalize_card_number(std::string_view number)
{
    std::string result;
    result.reserve(number.size());
    for (auto c : number) {
        if (c != ' ' && c != '-' && c != '_') {
            result.push_back(c);
        }
    }
    return result;
}

std::string to_string(const card &c)
{
    return fmt::format("{}|{}|{}|{}", c.number, c.month, c.year, c.cvv);
}

} // namespace luhngen
