// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string_view>

#include <yaml-cpp/yaml.h>

#include "configuration/generator_config.hpp"

namespace luhngen {

generator_config parse_generator_config(const YAML::Node &root, unsigned current_year);
generator_config parse_generator_config(std::string_view yaml, unsigned current_year);
generator_config load_generator_config(std::string_view path, unsigned current_year);

} // namespace luhngen
