// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>
#include <string_view>

#include "category.hpp"
#include "exception.hpp"
#include "utils.hpp"

namespace innval {

inn_category classify(std::string_view inn) noexcept
{
    inn = trim(inn);
    if (inn.size() == organization_inn_length) {
        return inn_category::organization;
    }

    if (inn.size() == individual_inn_length) {
        return inn_category::individual;
    }

    return inn_category::invalid;
}

std::string_view inn_category_to_string(inn_category category) noexcept
{
    switch (category) {
    case inn_category::organization:
        return "organization";
    case inn_category::individual:
        return "individual";
    case inn_category::invalid:
        break;
    }
    return "invalid";
}

inn_category inn_category_from_string(std::string_view str)
{
    if (str == "organization") {
        return inn_category::organization;
    }

    if (str == "individual") {
        return inn_category::individual;
    }

    throw parsing_error("unknown taxpayer category: '" + std::string{str} + "'");
}

} // namespace innval
