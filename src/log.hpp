// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include <fmt/core.h> // IWYU pragma: keep

#include "innval.h"

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
constexpr const char *base_name(const char *path)
{
    const char *base = path;
    while (*path != '\0') {
#ifdef _WIN32
        char separator = '\\';
#else
        const char separator = '/';
#endif
        if (*path++ == separator) {
            base = path;
        }
    }
    return base;
}

#define INNVAL_LOG_HELPER(level, function, file, line, fmt_str, ...)                               \
    {                                                                                              \
        if (innval::logger::valid(level)) {                                                        \
            try {                                                                                  \
                constexpr const char *filename = base_name(file);                                  \
                auto message = fmt::format(fmt_str, ##__VA_ARGS__);                                \
                innval::logger::log(                                                               \
                    level, function, filename, line, message.c_str(), message.size());             \
            } catch (...) {}                                                                       \
        }                                                                                          \
    }

#define INNVAL_LOG(level, fmt, ...)                                                                \
    INNVAL_LOG_HELPER(level, __func__, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define INNVAL_TRACE(fmt, ...) INNVAL_LOG(innval::log_level::trace, fmt, ##__VA_ARGS__)
#define INNVAL_DEBUG(fmt, ...) INNVAL_LOG(innval::log_level::debug, fmt, ##__VA_ARGS__)
#define INNVAL_INFO(fmt, ...) INNVAL_LOG(innval::log_level::info, fmt, ##__VA_ARGS__)
#define INNVAL_WARN(fmt, ...) INNVAL_LOG(innval::log_level::warn, fmt, ##__VA_ARGS__)
#define INNVAL_ERROR(fmt, ...) INNVAL_LOG(innval::log_level::error, fmt, ##__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)

namespace innval {

// This enum is 32 bit for compatibility with INNVAL_LOG_LEVEL
// NOLINTNEXTLINE(performance-enum-size)
enum class log_level : uint32_t {
    trace = INNVAL_LOG_TRACE,
    debug = INNVAL_LOG_DEBUG,
    info = INNVAL_LOG_INFO,
    warn = INNVAL_LOG_WARN,
    error = INNVAL_LOG_ERROR,
    off = INNVAL_LOG_OFF
};

inline std::string_view log_level_to_str(log_level level)
{
    switch (level) {
    case log_level::trace:
        return "trace";
    case log_level::debug:
        return "debug";
    case log_level::error:
        return "error";
    case log_level::warn:
        return "warn";
    case log_level::info:
        return "info";
    case log_level::off:
        break;
    }

    return "off";
}

class logger {
public:
    using log_cb_type = innval_log_cb;

    static void init(log_cb_type cb, log_level min_level);
    static bool valid(log_level level) { return cb != nullptr && level >= min_level; }
    static void log(log_level level, const char *function, const char *file, unsigned line,
        const char *message, size_t length);

private:
    static log_cb_type cb;
    static log_level min_level;
};

} // namespace innval
