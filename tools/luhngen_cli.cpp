// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "bin/bin_info.hpp"
#include "builder/checksum_builder.hpp"
#include "card_format.hpp"
#include "checksum/luhn_checksum.hpp"
#include "common/utils.hpp"
#include "configuration/generator_config.hpp"
#include "configuration/generator_config_parser.hpp"
#include "generator/card_generator.hpp"
#include "generator/random_source.hpp"
#include "luhngen.h"
#include "utils.hpp"

using namespace luhngen;

namespace {

void usage(const char *name)
{
    std::cerr << "Usage: " << name << " <command> [arguments]\n"
              << "  complete [--pretty] <prefix>       append the Luhn check digit\n"
              << "  check <number>                     validate a number, separators allowed\n"
              << "  generate <config.yaml> [--seed N]  generate cards from a configuration\n"
              << "  generate <bin> [quantity] [--seed N]\n"
              << "  bins                               list known test BINs\n"
              << "  describe <bin.json>                decode BIN metadata\n";
}

int complete(const std::vector<std::string_view> &args)
{
    bool pretty = false;
    std::optional<std::string_view> prefix;
    for (auto arg : args) {
        if (arg == "--pretty") {
            pretty = true;
        } else {
            prefix = arg;
        }
    }

    if (!prefix.has_value()) {
        std::cerr << "complete: missing prefix\n";
        return EXIT_FAILURE;
    }

    auto number = luhn_checksum{}.complete(*prefix);
    std::cout << (pretty ? format_card_number(number) : number) << '\n';
    return EXIT_SUCCESS;
}

int check(const std::vector<std::string_view> &args)
{
    if (args.size() != 1) {
        std::cerr << "check: expected exactly one number\n";
        return EXIT_FAILURE;
    }

    auto number = normalize_card_number(args[0]);
    if (luhn_checksum{}.validate(number)) {
        std::cout << number << ": valid\n";
        return EXIT_SUCCESS;
    }

    std::cout << number << ": invalid\n";
    return EXIT_FAILURE;
}

int generate(const std::vector<std::string_view> &args)
{
    std::optional<uint64_t> seed;
    std::vector<std::string_view> positional;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--seed") {
            if (i + 1 >= args.size()) {
                std::cerr << "generate: --seed requires a value\n";
                return EXIT_FAILURE;
            }

            auto [res, value] = from_string<uint64_t>(args[++i]);
            if (!res) {
                std::cerr << "generate: invalid seed '" << args[i] << "'\n";
                return EXIT_FAILURE;
            }
            seed = value;
        } else {
            positional.emplace_back(args[i]);
        }
    }

    if (positional.empty() || positional.size() > 2) {
        std::cerr << "generate: expected a configuration file or a bin\n";
        return EXIT_FAILURE;
    }

    const auto year = current_year();

    generator_config config;
    if (is_digit_string(positional[0])) {
        config.bin = positional[0];
        if (positional.size() == 2) {
            auto [res, quantity] = from_string<unsigned>(positional[1]);
            if (!res) {
                std::cerr << "generate: invalid quantity '" << positional[1] << "'\n";
                return EXIT_FAILURE;
            }
            config.quantity = quantity;
        }
    } else {
        config = load_generator_config(positional[0], year);
    }

    auto checksum = checksum_builder::build(config.algorithm);

    std::unique_ptr<random_source> rng;
    if (seed.has_value()) {
        rng = std::make_unique<mt_random_source>(*seed);
    } else {
        rng = std::make_unique<mt_random_source>();
    }

    card_generator generator{*rng, *checksum, year};
    for (const auto &c : generator.generate(config)) {
        std::cout << to_string(c) << '\n';
    }

    return EXIT_SUCCESS;
}

int bins()
{
    for (const auto &entry : known_test_bins()) {
        std::cout << entry.bin << '\t' << entry.network << '\n';
    }
    return EXIT_SUCCESS;
}

int describe(const std::vector<std::string_view> &args)
{
    if (args.size() != 1) {
        std::cerr << "describe: expected exactly one file\n";
        return EXIT_FAILURE;
    }

    auto info = parse_bin_info(read_file(args[0]));
    std::cout << "Scheme:  " << info.scheme << '\n'
              << "Type:    " << info.type << '\n'
              << "Brand:   " << info.brand << '\n'
              << "Country: " << info.country.name;
    if (!info.country.alpha2.empty()) {
        std::cout << " (" << info.country.alpha2 << ")";
    }
    std::cout << '\n' << "Bank:    " << info.bank.name << '\n';
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char *argv[])
{
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    auto *env_level = getenv("LUHNGEN_LOG_LEVEL");
    if (env_level != nullptr) {
        luhngen_set_log_cb(log_cb, str_to_level(env_level));
    }

    if (argc < 2) {
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    const std::string_view command = argv[1];
    std::vector<std::string_view> args{argv + 2, argv + argc};

    try {
        if (command == "complete") {
            return complete(args);
        }

        if (command == "check") {
            return check(args);
        }

        if (command == "generate") {
            return generate(args);
        }

        if (command == "bins") {
            return bins();
        }

        if (command == "describe") {
            return describe(args);
        }
    } catch (const std::exception &e) {
        std::cerr << command << ": " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    usage(argv[0]);
    return EXIT_FAILURE;
}
