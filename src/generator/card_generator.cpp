// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "configuration/generator_config.hpp"
#include "exception.hpp"
#include "generator/card_generator.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace luhngen {

std::string card_generator::digits(std::size_t count)
{
    std::string result;
    result.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        result.push_back(static_cast<char>('0' + rng_.uniform(0, 9)));
    }
    return result;
}

std::string card_generator::month() { return fmt::format("{:02}", rng_.uniform(1, 12)); }

std::string card_generator::year()
{
    return fmt::format("{}", current_year_ + rng_.uniform(0, year_window - 1));
}

std::string card_generator::cvv() { return digits(cvv_length); }

std::string card_generator::number(std::string_view bin, std::size_t length)
{
    if (!is_digit_string(bin)) {
        throw invalid_input("bin must be a non-empty string of digits");
    }

    if (bin.size() >= length) {
        throw invalid_input(fmt::format(
            "bin of {} digits leaves no room for a {} digit number", bin.size(), length));
    }

    std::string prefix{bin};
    prefix += digits(length - 1 - bin.size());
    return checksum_.complete(prefix);
}

card card_generator::make_card(const generator_config &config)
{
    card result;
    result.number = number(config.bin, config.length);
    result.month = config.month.has_value() ? *config.month : month();
    result.year = config.year.has_value() ? *config.year : year();
    result.cvv = config.cvv.has_value() ? *config.cvv : cvv();
    return result;
}

std::vector<card> card_generator::generate(const generator_config &config)
{
    auto checked = validate_generator_config(config, current_year_);

    std::vector<card> cards;
    cards.reserve(checked.quantity);
    for (unsigned i = 0; i < checked.quantity; ++i) {
        cards.emplace_back(make_card(checked));
    }

    LUHNGEN_DEBUG("Generated {} cards from bin {}", cards.size(), checked.bin);

    return cards;
}

} // namespace luhngen
