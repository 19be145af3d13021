// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.
#include <cerrno>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>

#include "innval.h"
#include "utils.hpp"

const char* level_to_str(INNVAL_LOG_LEVEL level)
{
    switch (level)
    {
        case INNVAL_LOG_TRACE:
            return "trace";
        case INNVAL_LOG_DEBUG:
            return "debug";
        case INNVAL_LOG_ERROR:
            return "error";
        case INNVAL_LOG_WARN:
            return "warn";
        case INNVAL_LOG_INFO:
            return "info";
        case INNVAL_LOG_OFF:
            break;
    }

    return "off";
}

void log_cb(INNVAL_LOG_LEVEL level,
            const char* function, const char* file, unsigned line,
            const char* message, uint64_t  /*length*/)
{
    std::cout << "[" << level_to_str(level)
              << "][" << file
              << ":" << function
              << ":" << line
              << "]: " << message
              << '\n';
}

std::string read_file(std::string_view filename)
{
    std::ifstream vector_file(std::string{filename}, std::ios::in);
    if (!vector_file)
    {
        throw std::system_error(errno, std::generic_category());
    }

    // Create a buffer equal to the file size
    std::string buffer;
    vector_file.seekg(0, std::ios::end);
    buffer.resize(vector_file.tellg());
    vector_file.seekg(0, std::ios::beg);

    vector_file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    vector_file.close();
    return buffer;
}
