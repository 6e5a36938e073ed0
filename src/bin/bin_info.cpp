// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <span>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "bin/bin_info.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace luhngen {

namespace {

constexpr std::array<known_bin, 19> test_bins{{
    {"48478325827", "Visa"},
    {"5547182000", "Mastercard"},
    {"55791004117", "Mastercard"},
    {"4222823000", "Visa"},
    {"52281970004", "Mastercard"},
    {"35629746062", "JCB"},
    {"40276658", "Visa"},
    {"55790830137", "Mastercard"},
    {"55790701530", "Mastercard"},
    {"55790990127", "Mastercard"},
    {"4106210003", "Visa"},
    {"55490060010", "Mastercard"},
    {"55325300053", "Mastercard"},
    {"527522000", "Mastercard"},
    {"4628450067688", "Visa"},
    {"533187001", "Mastercard"},
    {"4312316013", "Visa"},
    {"4680056032", "Visa"},
    {"47505561204", "Visa"},
}};

void copy_string(const rapidjson::Value &object, const char *key, std::string &output)
{
    auto it = object.FindMember(key);
    if (it == object.MemberEnd()) {
        return;
    }

    if (!it->value.IsString()) {
        LUHNGEN_DEBUG("Ignoring non-string value for '{}'", key);
        return;
    }

    // Empty values are as good as missing
    if (it->value.GetStringLength() > 0) {
        output.assign(it->value.GetString(), it->value.GetStringLength());
    }
}

const rapidjson::Value *find_object(const rapidjson::Value &object, const char *key)
{
    auto it = object.FindMember(key);
    if (it == object.MemberEnd() || !it->value.IsObject()) {
        return nullptr;
    }
    return &it->value;
}

} // namespace

bool is_valid_bin(std::string_view bin) { return bin.size() == bin_length && is_digit_string(bin); }

bin_info parse_bin_info(std::string_view json)
{
    if (json.empty()) {
        throw parsing_error("empty bin metadata");
    }

    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        throw parsing_error(fmt::format("malformed bin metadata at offset {}: {}",
            doc.GetErrorOffset(), rapidjson::GetParseError_En(doc.GetParseError())));
    }

    if (!doc.IsObject()) {
        throw parsing_error("bin metadata must be a JSON object");
    }

    bin_info info;
    copy_string(doc, "scheme", info.scheme);
    copy_string(doc, "type", info.type);
    copy_string(doc, "brand", info.brand);

    if (const auto *country = find_object(doc, "country"); country != nullptr) {
        copy_string(*country, "name", info.country.name);
        copy_string(*country, "emoji", info.country.emoji);
        copy_string(*country, "alpha2", info.country.alpha2);
    }

    if (const auto *bank = find_object(doc, "bank"); bank != nullptr) {
        copy_string(*bank, "name", info.bank.name);
    }

    return info;
}

std::span<const known_bin> known_test_bins() { return test_bins; }

} // namespace luhngen
