// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>

#include "generator/card_generator.hpp"

namespace luhngen {

// "4242424242424242" -> "4242 4242 4242 4242"
std::string format_card_number(std::string_view number);

// Removes the ' ', '-' and '_' separators, anything else is kept as is
std::string normalize_card_number(std::string_view number);

// number|MM|YYYY|CVV
std::string to_string(const card &c);

} // namespace luhngen
