// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
// (string, length), only for literals
#define STRL(value) value, sizeof(value) - 1
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace innval {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
inline bool isdigit(char c) { return static_cast<unsigned>(c) - '0' < 10; }
inline bool isspace(char c)
{
    return c == ' ' || c == '\f' || c == '\n' || c == '\r' || c == '\t' || c == '\v';
}
inline uint8_t to_digit(char c) { return static_cast<uint8_t>(c - '0'); }
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

// Removes leading and trailing whitespace, the view still refers to the
// original buffer.
inline std::string_view trim(std::string_view str) noexcept
{
    std::size_t begin = 0;
    while (begin < str.size() && isspace(str[begin])) { ++begin; }

    std::size_t end = str.size();
    while (end > begin && isspace(str[end - 1])) { --end; }

    return str.substr(begin, end - begin);
}

} // namespace innval
