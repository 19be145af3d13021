// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <exception>
#include <string_view>

#include "category.hpp"
#include "checksum/inn_checksum.hpp"
#include "configuration/configuration.hpp"
#include "innval.h"
#include "log.hpp"
#include "validator.hpp"
#include "version.hpp"

using namespace innval;

namespace {

std::string_view to_view(const char *str, size_t length)
{
    if (str == nullptr) {
        return {};
    }
    return {str, length};
}

} // namespace

extern "C" {

bool innval_validate(const char *inn, size_t length)
{
    if (inn == nullptr) {
        INNVAL_DEBUG("Illegal call: inn was null");
        return false;
    }

    return innval::validate(to_view(inn, length));
}

INNVAL_CATEGORY innval_classify(const char *inn, size_t length)
{
    if (inn == nullptr) {
        return INNVAL_CATEGORY_INVALID;
    }

    return static_cast<INNVAL_CATEGORY>(classify(to_view(inn, length)));
}

innval::validator *innval_init(const innval_config *config)
{
    try {
        return new innval::validator{configuration_from_config(config)};
    } catch (const std::exception &e) {
        INNVAL_ERROR("{}", e.what());
    } catch (...) {
        INNVAL_ERROR("unknown exception");
    }

    return nullptr;
}

bool innval_handle_validate(innval::validator *handle, const char *inn, size_t length)
{
    if (handle == nullptr || inn == nullptr) {
        INNVAL_WARN("Illegal call: handle or inn was null");
        return false;
    }

    return handle->validate(to_view(inn, length));
}

bool innval_search(innval::validator *handle, const char *text, size_t length, size_t *offset,
    size_t *match_length)
{
    if (handle == nullptr || text == nullptr) {
        INNVAL_WARN("Illegal call: handle or text was null");
        return false;
    }

    try {
        auto [found, match] = handle->search(to_view(text, length));
        if (!found) {
            return false;
        }

        if (offset != nullptr) {
            *offset = static_cast<size_t>(match.data() - text);
        }

        if (match_length != nullptr) {
            *match_length = match.size();
        }
        return true;
    } catch (const std::exception &e) {
        INNVAL_ERROR("{}", e.what());
    } catch (...) {
        INNVAL_ERROR("unknown exception");
    }

    return false;
}

void innval_destroy(innval::validator *handle)
{
    try {
        delete handle;
    } catch (const std::exception &e) {
        INNVAL_ERROR("{}", e.what());
    } catch (...) {
        INNVAL_ERROR("unknown exception");
    }
}

const char *innval_get_version() { return innval::current_version; }

bool innval_set_log_cb(innval_log_cb cb, INNVAL_LOG_LEVEL min_level)
{
    auto level = static_cast<log_level>(min_level);
    logger::init(cb, level);
    INNVAL_INFO("Sending log messages to binding, min level {}", log_level_to_str(level));
    return true;
}
}
