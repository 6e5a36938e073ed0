// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstdint>
#include <cstring>

#include "luhngen.h"

#include "common/gtest_utils.hpp"

namespace {

TEST(TestInterface, ComputeCheckDigit)
{
    char digit = 'x';
    EXPECT_EQ(luhngen_compute_check_digit("7992739871", 10, &digit), LUHNGEN_OK);
    EXPECT_EQ(digit, '3');

    EXPECT_EQ(luhngen_compute_check_digit("4", 1, &digit), LUHNGEN_OK);
    EXPECT_EQ(digit, '2');

    // Only the first length characters are considered
    EXPECT_EQ(luhngen_compute_check_digit("7992739871abc", 10, &digit), LUHNGEN_OK);
    EXPECT_EQ(digit, '3');
}

TEST(TestInterface, ComputeCheckDigitInvalidArgument)
{
    char digit = 'x';
    EXPECT_EQ(luhngen_compute_check_digit(nullptr, 10, &digit), LUHNGEN_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(luhngen_compute_check_digit("", 0, &digit), LUHNGEN_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(luhngen_compute_check_digit("12a3", 4, &digit), LUHNGEN_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(luhngen_compute_check_digit("1234", 4, nullptr), LUHNGEN_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(digit, 'x');
}

TEST(TestInterface, Validate)
{
    EXPECT_EQ(luhngen_validate("79927398713", 11), LUHNGEN_OK);
    EXPECT_EQ(luhngen_validate("79927398710", 11), LUHNGEN_CHECKSUM_MISMATCH);
    EXPECT_EQ(luhngen_validate("0", 1), LUHNGEN_OK);
    EXPECT_EQ(luhngen_validate("1", 1), LUHNGEN_CHECKSUM_MISMATCH);
}

TEST(TestInterface, ValidateInvalidArgument)
{
    EXPECT_EQ(luhngen_validate(nullptr, 11), LUHNGEN_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(luhngen_validate("", 0), LUHNGEN_ERR_INVALID_ARGUMENT);
    EXPECT_EQ(luhngen_validate("7992 7398 713", 13), LUHNGEN_ERR_INVALID_ARGUMENT);
}

TEST(TestInterface, RoundTrip)
{
    // NOLINTNEXTLINE(modernize-avoid-c-arrays)
    const char *prefixes[] = {"4", "42424242424242", "000000000", "35629746062", "5547182000"};
    for (const auto *prefix : prefixes) {
        const auto length = static_cast<uint32_t>(strlen(prefix));

        // NOLINTNEXTLINE(modernize-avoid-c-arrays)
        char buffer[64] = {0};
        memcpy(buffer, prefix, length);
        ASSERT_EQ(luhngen_compute_check_digit(prefix, length, &buffer[length]), LUHNGEN_OK);
        EXPECT_EQ(luhngen_validate(buffer, length + 1), LUHNGEN_OK) << buffer;
    }
}

TEST(TestInterface, Version) { EXPECT_GT(strlen(luhngen_get_version()), 0U); }

} // namespace
