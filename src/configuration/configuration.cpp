// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <fmt/format.h>

#include "category.hpp"
#include "configuration/configuration.hpp"
#include "exception.hpp"
#include "innval.h"

namespace innval {

configuration configuration_from_config(const innval_config *config)
{
    configuration cfg;
    if (config == nullptr) {
        return cfg;
    }

    if ((config->categories & ~all_categories) != 0) {
        throw parsing_error(fmt::format("invalid category mask: {:#x}", config->categories));
    }

    if (config->categories != 0) {
        cfg.categories = config->categories;
    }

    if (config->search_regex != nullptr) {
        cfg.search_regex = config->search_regex;
        if (cfg.search_regex.empty()) {
            throw parsing_error("empty search regular expression");
        }
    }

    return cfg;
}

} // namespace innval
