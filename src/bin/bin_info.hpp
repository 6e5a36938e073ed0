// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace luhngen {

inline constexpr std::size_t bin_length = 6;

// Issuer metadata of a BIN, as returned by binlist-like lookup services
struct bin_info {
    struct country_info {
        std::string name{"Unknown"};
        std::string emoji;
        std::string alpha2;
    };

    struct bank_info {
        std::string name{"Unknown"};
    };

    std::string scheme{"Unknown"};
    std::string type{"Unknown"};
    std::string brand{"Unknown"};
    country_info country;
    bank_info bank;
};

struct known_bin {
    std::string_view bin;
    std::string_view network;
};

// Exactly six digits
bool is_valid_bin(std::string_view bin);

// Decodes a lookup response, fields which are missing or not strings keep
// their default value. Throws parsing_error on malformed JSON or when the
// root isn't an object.
bin_info parse_bin_info(std::string_view json);

// Test card prefixes accepted by common payment sandboxes
std::span<const known_bin> known_test_bins();

} // namespace luhngen
