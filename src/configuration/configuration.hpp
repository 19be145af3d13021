// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string>

#include "category.hpp"
#include "innval.h"
#include "matcher/inn_match.hpp"

namespace innval {

struct configuration {
    category_set categories{all_categories};
    std::string search_regex{matcher::default_inn_regex};
};

// Converts the public configuration, a null config selects the defaults.
configuration configuration_from_config(const innval_config *config);

} // namespace innval
