// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

#include "category.hpp"
#include "checksum/base.hpp"

namespace innval {

// Weights applied positionally to the digits preceding each control digit,
// index 0 corresponds to the first digit of the INN.
namespace inn_coefficients {
inline constexpr std::array<uint8_t, 10> organization = {2, 4, 10, 3, 5, 9, 4, 6, 8, 0};
inline constexpr std::array<uint8_t, 11> individual_n2 = {7, 2, 4, 10, 3, 5, 9, 4, 6, 8, 0};
inline constexpr std::array<uint8_t, 12> individual_n1 = {3, 7, 2, 4, 10, 3, 5, 9, 4, 6, 8, 0};
} // namespace inn_coefficients

// Exposed for testing, digits must only contain decimal digits and must not
// be longer than the coefficient table.
uint8_t compute_control_digit(
    std::string_view digits, std::span<const uint8_t> coefficients) noexcept;

class inn_checksum : public base_checksum {
public:
    explicit inn_checksum(category_set categories = all_categories) : categories_(categories) {}
    inn_checksum(const inn_checksum &) = default;
    inn_checksum &operator=(const inn_checksum &) = default;
    inn_checksum(inn_checksum &&) = default;
    inn_checksum &operator=(inn_checksum &&) = default;
    ~inn_checksum() override = default;

    [[nodiscard]] bool validate(std::string_view str) const noexcept override;
    [[nodiscard]] category_set categories() const noexcept { return categories_; }

protected:
    category_set categories_;
};

// Validates an INN of any category
bool validate(std::string_view inn) noexcept;

} // namespace innval
