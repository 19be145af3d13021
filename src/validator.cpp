// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include "builder/checksum_builder.hpp"
#include "configuration/configuration.hpp"
#include "log.hpp"
#include "validator.hpp"

namespace innval {

validator::validator(const configuration &cfg)
    : categories_(cfg.categories), checksum_(checksum_builder::build(cfg.categories)),
      matcher_(cfg.search_regex, checksum_builder::build(cfg.categories))
{
    INNVAL_DEBUG("Validator initialised with category mask {:#x}", categories_);
}

} // namespace innval
