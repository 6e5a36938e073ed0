// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#ifndef LUHNGEN_VERSION
#  error "LUHNGEN_VERSION must be provided by the build"
#endif

namespace luhngen {

inline constexpr const char *current_version = LUHNGEN_VERSION;

} // namespace luhngen
