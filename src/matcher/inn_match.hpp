// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <memory>
#include <re2/re2.h>
#include <string>
#include <string_view>
#include <utility>

#include "category.hpp"
#include "checksum/base.hpp"

namespace innval::matcher {

// Locates digit runs of INN length which aren't part of a longer number. RE2
// lacks lookarounds, so boundaries are consumed and the INN is captured.
inline constexpr std::string_view default_inn_regex =
    "(?:^|[^0-9])([0-9]{12}|[0-9]{10})(?:[^0-9]|$)";

class inn_match {
public:
    static constexpr std::string_view matcher_name = "inn_match";

    inn_match(const std::string &regex_str, std::unique_ptr<base_checksum> &&algo,
        std::size_t minLength = organization_inn_length);
    ~inn_match() = default;
    inn_match(const inn_match &) = delete;
    inn_match(inn_match &&) noexcept = default;
    inn_match &operator=(const inn_match &) = delete;
    inn_match &operator=(inn_match &&) noexcept = default;

    [[nodiscard]] std::string_view to_string() const { return regex->pattern(); }

    // On success, the returned view refers to the input buffer
    [[nodiscard]] std::pair<bool, std::string_view> match(std::string_view pattern) const;

protected:
    std::unique_ptr<re2::RE2> regex{nullptr};
    std::size_t min_length;

    std::unique_ptr<base_checksum> algo_;
};

} // namespace innval::matcher
