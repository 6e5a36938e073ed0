// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstdint>
#include <random>

namespace luhngen {

class random_source {
public:
    random_source() = default;
    random_source(const random_source &) = delete;
    random_source &operator=(const random_source &) = delete;
    random_source(random_source &&) = delete;
    random_source &operator=(random_source &&) = delete;
    virtual ~random_source() = default;

    // Uniformly distributed integer within [min, max]
    virtual uint64_t uniform(uint64_t min, uint64_t max) = 0;
};

// Not thread-safe, each thread should own its source
class mt_random_source : public random_source {
public:
    // Seeded from the system clock
    mt_random_source();
    explicit mt_random_source(uint64_t seed) : rng_(seed) {}
    mt_random_source(const mt_random_source &) = delete;
    mt_random_source &operator=(const mt_random_source &) = delete;
    mt_random_source(mt_random_source &&) = delete;
    mt_random_source &operator=(mt_random_source &&) = delete;
    ~mt_random_source() override = default;

    uint64_t uniform(uint64_t min, uint64_t max) override;

protected:
    std::mt19937_64 rng_;
};

} // namespace luhngen
