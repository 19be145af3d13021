// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "innval.h"

namespace innval {

enum class inn_category : uint8_t {
    invalid = INNVAL_CATEGORY_INVALID,
    organization = INNVAL_CATEGORY_ORGANIZATION,
    individual = INNVAL_CATEGORY_INDIVIDUAL,
};

inline constexpr std::size_t organization_inn_length = 10;
inline constexpr std::size_t individual_inn_length = 12;

// Bitmask of inn_category values
using category_set = uint32_t;
inline constexpr category_set all_categories =
    static_cast<category_set>(inn_category::organization) |
    static_cast<category_set>(inn_category::individual);

constexpr bool category_allowed(category_set set, inn_category category)
{
    return category != inn_category::invalid && (set & static_cast<category_set>(category)) != 0;
}

// Classification only looks at the trimmed length
inn_category classify(std::string_view inn) noexcept;

std::string_view inn_category_to_string(inn_category category) noexcept;
inn_category inn_category_from_string(std::string_view str);

} // namespace innval
