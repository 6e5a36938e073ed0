// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "checksum/base.hpp"
#include "configuration/generator_config.hpp"
#include "generator/random_source.hpp"

namespace luhngen {

struct card {
    std::string number;
    std::string month;
    std::string year;
    std::string cvv;

    bool operator==(const card &other) const = default;
};

class card_generator {
public:
    // Random years are drawn from [current_year, current_year + year_window)
    static constexpr unsigned year_window = 5;
    static constexpr std::size_t cvv_length = 3;

    card_generator(random_source &rng, const base_checksum &checksum, unsigned current_year)
        : rng_(rng), checksum_(checksum), current_year_(current_year)
    {}
    card_generator(const card_generator &) = delete;
    card_generator &operator=(const card_generator &) = delete;
    card_generator(card_generator &&) = delete;
    card_generator &operator=(card_generator &&) = delete;
    ~card_generator() = default;

    std::string digits(std::size_t count);
    std::string month();
    std::string year();
    std::string cvv();

    // The bin padded with random digits up to length - 1, followed by the
    // check digit.
    std::string number(std::string_view bin, std::size_t length);

    card make_card(const generator_config &config);
    std::vector<card> generate(const generator_config &config);

protected:
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    random_source &rng_;
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    const base_checksum &checksum_;
    unsigned current_year_;
};

} // namespace luhngen
