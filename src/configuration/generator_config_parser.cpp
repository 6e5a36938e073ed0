// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "configuration/generator_config.hpp"
#include "configuration/generator_config_parser.hpp"
#include "exception.hpp"
#include "log.hpp"

namespace luhngen {

namespace {

constexpr std::array<std::string_view, 7> known_keys{
    "bin", "quantity", "length", "month", "year", "cvv", "algorithm"};

template <typename T> T scalar_as(const YAML::Node &node, const std::string &key)
{
    if (!node.IsScalar()) {
        throw invalid_type(key, "scalar");
    }

    try {
        return node.as<T>();
    } catch (const YAML::BadConversion &) {
        throw invalid_type(key, std::is_same_v<T, std::string> ? "string" : "unsigned integer");
    }
}

template <typename T> T at(const YAML::Node &root, const std::string &key)
{
    auto node = root[key];
    if (!node.IsDefined() || node.IsNull()) {
        throw missing_key(key);
    }
    return scalar_as<T>(node, key);
}

template <typename T> std::optional<T> at_optional(const YAML::Node &root, const std::string &key)
{
    auto node = root[key];
    if (!node.IsDefined() || node.IsNull()) {
        return std::nullopt;
    }
    return scalar_as<T>(node, key);
}

} // namespace

generator_config parse_generator_config(const YAML::Node &root, unsigned current_year)
{
    if (!root.IsMap()) {
        throw parsing_error("generator configuration must be a map");
    }

    for (auto it = root.begin(); it != root.end(); ++it) {
        if (!it->first.IsScalar()) {
            throw parsing_error("generator configuration keys must be scalars");
        }

        auto key = it->first.Scalar();
        if (std::find(known_keys.begin(), known_keys.end(), key) == known_keys.end()) {
            LUHNGEN_WARN("Ignoring unknown configuration key '{}'", key);
        }
    }

    generator_config config;
    config.bin = at<std::string>(root, "bin");
    config.quantity =
        at_optional<unsigned>(root, "quantity").value_or(generator_config::default_quantity);
    config.length = at_optional<unsigned>(root, "length")
                        .value_or(static_cast<unsigned>(generator_config::default_length));
    config.month = at_optional<std::string>(root, "month");
    config.year = at_optional<std::string>(root, "year");
    config.cvv = at_optional<std::string>(root, "cvv");
    config.algorithm = at_optional<std::string>(root, "algorithm").value_or("luhn");

    config = validate_generator_config(std::move(config), current_year);

    LUHNGEN_DEBUG("Loaded generator configuration: bin {}, quantity {}, length {}", config.bin,
        config.quantity, config.length);

    return config;
}

generator_config parse_generator_config(std::string_view yaml, unsigned current_year)
{
    YAML::Node root;
    try {
        root = YAML::Load(std::string{yaml});
    } catch (const YAML::ParserException &e) {
        throw parsing_error(std::string{"malformed yaml: "} + e.what());
    }
    return parse_generator_config(root, current_year);
}

generator_config load_generator_config(std::string_view path, unsigned current_year)
{
    LUHNGEN_DEBUG("Opening {}", path);

    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string{path});
    } catch (const YAML::BadFile &) {
        throw parsing_error(std::string{"unable to open "} + std::string{path});
    } catch (const YAML::ParserException &e) {
        throw parsing_error(std::string{"malformed yaml: "} + e.what());
    }
    return parse_generator_config(root, current_year);
}

} // namespace luhngen
