// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <algorithm>
#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "checksum/base.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "matcher/inn_match.hpp"

namespace innval::matcher {

inn_match::inn_match(
    const std::string &regex_str, std::unique_ptr<base_checksum> &&algo, std::size_t minLength)
    : min_length(minLength), algo_(std::move(algo))
{
    constexpr unsigned regex_max_mem = 512 * 1024;

    if (!algo_) {
        throw parsing_error("invalid checksum algorithm");
    }

    re2::RE2::Options options;
    options.set_max_mem(regex_max_mem);
    options.set_log_errors(false);

    regex = std::make_unique<re2::RE2>(regex_str, options);
    if (!regex->ok()) {
        throw parsing_error("invalid regular expression: " + regex->error_arg());
    }

    INNVAL_DEBUG("Compiled INN search pattern '{}'", regex->pattern());
}

std::pair<bool, std::string_view> inn_match::match(std::string_view pattern) const
{
    if (pattern.data() == nullptr) {
        return {false, {}};
    }

    // Report the first capture group when the pattern has one
    const int nsubmatch = regex->NumberOfCapturingGroups() > 0 ? 2 : 1;
    const auto candidate_idx = static_cast<std::size_t>(nsubmatch - 1);

    while (pattern.size() >= min_length) {
        std::array<re2::StringPiece, 2> submatches;
        if (!regex->Match(
                pattern, 0, pattern.size(), re2::RE2::UNANCHORED, submatches.data(), nsubmatch)) {
            break;
        }

        const std::string_view whole{submatches[0].data(), submatches[0].size()};
        if (whole.data() == nullptr) {
            break;
        }

        std::string_view candidate{
            submatches[candidate_idx].data(), submatches[candidate_idx].size()};
        if (candidate.data() == nullptr) {
            candidate = whole;
        }

        if (algo_->validate(candidate)) {
            return {true, candidate};
        }

        INNVAL_TRACE("Rejected INN candidate '{}'", candidate);

        // Resume right after the candidate so that a trailing boundary
        // can be reused as the leading boundary of the next one
        auto consumed = static_cast<std::size_t>(candidate.data() - pattern.data()) +
                        candidate.size();
        if (consumed == 0) {
            consumed = static_cast<std::size_t>(whole.data() - pattern.data()) + 1;
        }
        pattern.remove_prefix(std::min(consumed, pattern.size()));
    }

    return {false, {}};
}

} // namespace innval::matcher
