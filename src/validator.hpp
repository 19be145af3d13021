// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <memory>
#include <string_view>
#include <utility>

#include "category.hpp"
#include "checksum/base.hpp"
#include "configuration/configuration.hpp"
#include "matcher/inn_match.hpp"

namespace innval {

// Immutable once constructed, may be shared across threads.
class validator {
public:
    explicit validator(const configuration &cfg);
    ~validator() = default;
    validator(const validator &) = delete;
    validator(validator &&) noexcept = default;
    validator &operator=(const validator &) = delete;
    validator &operator=(validator &&) noexcept = default;

    [[nodiscard]] bool validate(std::string_view inn) const noexcept
    {
        return checksum_->validate(inn);
    }

    [[nodiscard]] std::pair<bool, std::string_view> search(std::string_view text) const
    {
        return matcher_.match(text);
    }

    [[nodiscard]] category_set categories() const noexcept { return categories_; }

protected:
    category_set categories_;
    std::unique_ptr<base_checksum> checksum_;
    matcher::inn_match matcher_;
};

} // namespace innval
