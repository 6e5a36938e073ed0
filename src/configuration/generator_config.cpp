// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>

#include <fmt/format.h>

#include "configuration/generator_config.hpp"
#include "exception.hpp"
#include "utils.hpp"

namespace luhngen {

namespace {

void validate_bin(const generator_config &config)
{
    if (!is_digit_string(config.bin)) {
        throw parsing_error("bin must be a non-empty string of digits");
    }

    if (config.bin.size() < generator_config::min_bin_length) {
        throw parsing_error(fmt::format(
            "bin must have at least {} digits", generator_config::min_bin_length));
    }

    if (config.bin.size() >= config.length) {
        throw parsing_error(fmt::format(
            "bin of {} digits leaves no room for a {} digit number", config.bin.size(), config.length));
    }
}

std::string normalize_month(const std::string &month)
{
    auto [res, value] = from_string<unsigned>(month);
    if (!res || month.size() > 2 || value < 1 || value > 12) {
        throw parsing_error(fmt::format("invalid month '{}', expected 01 to 12", month));
    }
    return fmt::format("{:02}", value);
}

void validate_year(const std::string &year, unsigned current_year)
{
    auto [res, value] = from_string<unsigned>(year);
    if (!res || year.size() != 4) {
        throw parsing_error(fmt::format("invalid year '{}', expected four digits", year));
    }

    if (value < current_year || value > current_year + generator_config::max_year_offset) {
        throw parsing_error(fmt::format("year {} outside of [{}, {}]", value, current_year,
            current_year + generator_config::max_year_offset));
    }
}

} // namespace

generator_config validate_generator_config(generator_config config, unsigned current_year)
{
    if (config.length < generator_config::min_length ||
        config.length > generator_config::max_length) {
        throw parsing_error(fmt::format("length must be between {} and {}",
            generator_config::min_length, generator_config::max_length));
    }

    validate_bin(config);

    if (config.quantity == 0 || config.quantity > generator_config::max_quantity) {
        throw parsing_error(
            fmt::format("quantity must be between 1 and {}", generator_config::max_quantity));
    }

    if (config.month.has_value()) {
        config.month = normalize_month(*config.month);
    }

    if (config.year.has_value()) {
        validate_year(*config.year, current_year);
    }

    if (config.cvv.has_value() && (config.cvv->size() != 3 || !is_digit_string(*config.cvv))) {
        throw parsing_error("cvv must be 3 digits");
    }

    if (config.algorithm.empty()) {
        throw parsing_error("algorithm can't be empty");
    }

    return config;
}

} // namespace luhngen
