// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace luhngen {

struct generator_config {
    static constexpr unsigned default_quantity = 10;
    static constexpr unsigned max_quantity = 500;
    static constexpr std::size_t default_length = 16;
    static constexpr std::size_t min_length = 12;
    static constexpr std::size_t max_length = 19;
    static constexpr std::size_t min_bin_length = 6;
    static constexpr unsigned max_year_offset = 15;

    std::string bin;
    unsigned quantity{default_quantity};
    std::size_t length{default_length};
    // Fixed values, drawn at random for each card when absent
    std::optional<std::string> month;
    std::optional<std::string> year;
    std::optional<std::string> cvv;
    std::string algorithm{"luhn"};
};

// Checks every field and returns a copy with the month zero-padded, throws
// parsing_error on the first violation found.
generator_config validate_generator_config(generator_config config, unsigned current_year);

} // namespace luhngen
