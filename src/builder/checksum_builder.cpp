// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <memory>
#include <string_view>

#include <fmt/format.h>

#include "builder/checksum_builder.hpp"
#include "category.hpp"
#include "checksum/base.hpp"
#include "checksum/inn_checksum.hpp"
#include "exception.hpp"
#include "log.hpp"

using namespace std::literals;

namespace innval {

std::unique_ptr<base_checksum> checksum_builder::build(std::string_view name)
{
    if (name == "inn"sv) {
        return std::make_unique<inn_checksum>(all_categories);
    }

    if (name == "inn_organization"sv) {
        return std::make_unique<inn_checksum>(
            static_cast<category_set>(inn_category::organization));
    }

    if (name == "inn_individual"sv) {
        return std::make_unique<inn_checksum>(static_cast<category_set>(inn_category::individual));
    }

    throw parsing_error(fmt::format("unknown checksum algorithm: '{}'", name));
}

std::unique_ptr<base_checksum> checksum_builder::build(category_set categories)
{
    if ((categories & ~all_categories) != 0) {
        throw parsing_error(fmt::format("invalid category mask: {:#x}", categories));
    }

    if (categories == 0) {
        categories = all_categories;
    }

    INNVAL_DEBUG("Building INN checksum for category mask {:#x}", categories);

    return std::make_unique<inn_checksum>(categories);
}

} // namespace innval
