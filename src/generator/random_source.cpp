// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <chrono>
#include <cstdint>
#include <random>
#include <utility>

#include "generator/random_source.hpp"

namespace luhngen {

namespace {
// System clock is used to provide a more unique seed compared to the
// monotonic clock, which is backed by a steady clock, in practice it
// likely doesn't make a difference.
using clock = std::chrono::system_clock;

uint64_t clock_seed() { return static_cast<uint64_t>(clock::now().time_since_epoch().count()); }

} // namespace

mt_random_source::mt_random_source() : rng_(clock_seed()) {}

uint64_t mt_random_source::uniform(uint64_t min, uint64_t max)
{
    if (min > max) {
        std::swap(min, max);
    }

    std::uniform_int_distribution<uint64_t> dist{min, max};
    return dist(rng_);
}

} // namespace luhngen
