// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <utility>

#include "configuration/generator_config.hpp"
#include "exception.hpp"

#include "common/gtest_utils.hpp"

using namespace luhngen;

namespace {

constexpr unsigned reference_year = 2026;

generator_config make_config(std::string bin = "424242")
{
    generator_config config;
    config.bin = std::move(bin);
    return config;
}

TEST(TestGeneratorConfig, Defaults)
{
    auto config = validate_generator_config(make_config(), reference_year);
    EXPECT_STR(config.bin, "424242");
    EXPECT_EQ(config.quantity, 10U);
    EXPECT_EQ(config.length, 16U);
    EXPECT_FALSE(config.month.has_value());
    EXPECT_FALSE(config.year.has_value());
    EXPECT_FALSE(config.cvv.has_value());
    EXPECT_STR(config.algorithm, "luhn");
}

TEST(TestGeneratorConfig, Bin)
{
    EXPECT_NO_THROW(validate_generator_config(make_config("000000"), reference_year));
    EXPECT_NO_THROW(validate_generator_config(make_config("424242424242424"), reference_year));

    EXPECT_THROW(validate_generator_config(make_config(""), reference_year), parsing_error);
    EXPECT_THROW(validate_generator_config(make_config("42424"), reference_year), parsing_error);
    EXPECT_THROW(validate_generator_config(make_config("4242a2"), reference_year), parsing_error);
    EXPECT_THROW(
        validate_generator_config(make_config("4242424242424242"), reference_year), parsing_error);

    auto config = make_config("4242424242424242");
    config.length = 19;
    EXPECT_NO_THROW(validate_generator_config(config, reference_year));
}

TEST(TestGeneratorConfig, Quantity)
{
    auto config = make_config();
    config.quantity = 1;
    EXPECT_NO_THROW(validate_generator_config(config, reference_year));

    config.quantity = 500;
    EXPECT_NO_THROW(validate_generator_config(config, reference_year));

    config.quantity = 0;
    EXPECT_THROW(validate_generator_config(config, reference_year), parsing_error);

    config.quantity = 501;
    EXPECT_THROW(validate_generator_config(config, reference_year), parsing_error);
}

TEST(TestGeneratorConfig, Length)
{
    auto config = make_config();
    config.length = 12;
    EXPECT_NO_THROW(validate_generator_config(config, reference_year));

    config.length = 11;
    EXPECT_THROW(validate_generator_config(config, reference_year), parsing_error);

    config.length = 20;
    EXPECT_THROW(validate_generator_config(config, reference_year), parsing_error);
}

TEST(TestGeneratorConfig, Month)
{
    auto config = make_config();

    config.month = "7";
    EXPECT_STR(*validate_generator_config(config, reference_year).month, "07");

    config.month = "07";
    EXPECT_STR(*validate_generator_config(config, reference_year).month, "07");

    config.month = "12";
    EXPECT_STR(*validate_generator_config(config, reference_year).month, "12");

    for (const auto *month : {"0", "00", "13", "007", "-1", "ab", ""}) {
        config.month = month;
        EXPECT_THROW(validate_generator_config(config, reference_year), parsing_error) << month;
    }
}

TEST(TestGeneratorConfig, Year)
{
    auto config = make_config();

    config.year = "2026";
    EXPECT_NO_THROW(validate_generator_config(config, reference_year));

    config.year = "2041";
    EXPECT_NO_THROW(validate_generator_config(config, reference_year));

    for (const auto *year : {"2025", "2042", "26", "02026", "20x6", ""}) {
        config.year = year;
        EXPECT_THROW(validate_generator_config(config, reference_year), parsing_error) << year;
    }
}

TEST(TestGeneratorConfig, Cvv)
{
    auto config = make_config();

    config.cvv = "000";
    EXPECT_NO_THROW(validate_generator_config(config, reference_year));

    config.cvv = "999";
    EXPECT_NO_THROW(validate_generator_config(config, reference_year));

    for (const auto *cvv : {"12", "1234", "12a", ""}) {
        config.cvv = cvv;
        EXPECT_THROW(validate_generator_config(config, reference_year), parsing_error) << cvv;
    }
}

TEST(TestGeneratorConfig, Algorithm)
{
    auto config = make_config();
    config.algorithm = "";
    EXPECT_THROW(validate_generator_config(config, reference_year), parsing_error);
}

} // namespace
