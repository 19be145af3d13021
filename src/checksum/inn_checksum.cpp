// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "category.hpp"
#include "checksum/inn_checksum.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace innval {

namespace {

constexpr uint32_t control_modulus = 11;

constexpr std::size_t organization_n1_index = 9;
constexpr std::size_t individual_n2_index = 10;
constexpr std::size_t individual_n1_index = 11;

bool validate_organization(std::string_view inn)
{
    auto n1 = compute_control_digit(
        inn.substr(0, organization_n1_index), inn_coefficients::organization);
    return n1 == to_digit(inn[organization_n1_index]);
}

bool validate_individual(std::string_view inn)
{
    // n2 precedes n1 in the number but n1 covers n2 in its checksum
    auto n2 = compute_control_digit(
        inn.substr(0, individual_n2_index), inn_coefficients::individual_n2);
    auto n1 = compute_control_digit(
        inn.substr(0, individual_n1_index), inn_coefficients::individual_n1);
    return n2 == to_digit(inn[individual_n2_index]) && n1 == to_digit(inn[individual_n1_index]);
}

} // namespace

uint8_t compute_control_digit(
    std::string_view digits, std::span<const uint8_t> coefficients) noexcept
{
    const std::size_t count = std::min(digits.size(), coefficients.size());

    uint32_t checksum = 0;
    for (std::size_t i = 0; i < count; ++i) {
        checksum += static_cast<uint32_t>(to_digit(digits[i])) * coefficients[i];
    }

    auto control = checksum % control_modulus;
    return control > 9 ? 0 : static_cast<uint8_t>(control);
}

bool inn_checksum::validate(std::string_view str) const noexcept
{
    str = trim(str);

    auto category = classify(str);
    if (category == inn_category::invalid) {
        INNVAL_TRACE("Unsupported INN length {}", str.size());
        return false;
    }

    if (!category_allowed(categories_, category)) {
        INNVAL_TRACE("INN category {} not accepted", inn_category_to_string(category));
        return false;
    }

    if (!std::all_of(str.begin(), str.end(), [](char c) { return isdigit(c); })) {
        INNVAL_TRACE("INN contains non-digit characters");
        return false;
    }

    if (category == inn_category::organization) {
        return validate_organization(str);
    }

    return validate_individual(str);
}

bool validate(std::string_view inn) noexcept
{
    return inn_checksum{}.validate(inn);
}

} // namespace innval
