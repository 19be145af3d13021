// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <string_view>
#include <yaml-cpp/yaml.h>

#include "common/utils.hpp"
#include "innval.h"

namespace {

bool runValidationVectors(const YAML::Node &vectors)
{
    bool success = true;
    std::size_t counter = 0;
    for (auto it = vectors.begin(); it != vectors.end(); ++it, ++counter) {
        auto input = (*it)["input"].as<std::string>();
        auto expected = (*it)["valid"].as<bool>();

        const bool result = innval_validate(input.data(), input.size());
        if (result != expected) {
            printf("Validation vector #%zu '%s' expected %s but got %s\n", counter, input.c_str(),
                expected ? "valid" : "invalid", result ? "valid" : "invalid");
            success = false;
        }
    }
    return success;
}

bool runSearchVectors(innval_handle handle, const YAML::Node &vectors)
{
    bool success = true;
    std::size_t counter = 0;
    for (auto it = vectors.begin(); it != vectors.end(); ++it, ++counter) {
        auto text = (*it)["text"].as<std::string>();
        auto match = (*it)["match"];
        const bool expected = match && !match.IsNull();

        std::size_t offset = 0;
        std::size_t length = 0;
        const bool found = innval_search(handle, text.data(), text.size(), &offset, &length);
        if (found != expected) {
            printf("Search vector #%zu %s\n", counter,
                expected ? "didn't find the expected INN" : "found an unexpected INN");
            success = false;
            continue;
        }

        if (found && std::string_view{text}.substr(offset, length) != match.as<std::string>()) {
            printf("Search vector #%zu found the wrong INN\n", counter);
            success = false;
        }
    }
    return success;
}

} // namespace

int main(int argc, char *argv[])
{
#ifdef VERBOSE
    innval_set_log_cb(log_cb, INNVAL_LOG_TRACE);
#endif

    if (argc < 2) {
        printf("Usage: %s <yaml file>...\n", argv[0]);
        return EXIT_FAILURE;
    }

    innval_handle handle = innval_init(nullptr);
    if (handle == nullptr) {
        printf("Failed to initialise the validator\n");
        return EXIT_FAILURE;
    }

    bool success = true;
    for (int fileIndex = 1; fileIndex < argc; ++fileIndex) {
#ifdef VERBOSE
        printf("Processing %s\n", argv[fileIndex]);
#endif
        try {
            YAML::Node root = YAML::Load(read_file(argv[fileIndex]));

            if (root["validation"]) {
                success &= runValidationVectors(root["validation"]);
            }

            if (root["search"]) {
                success &= runSearchVectors(handle, root["search"]);
            }
        } catch (const std::exception &e) {
            printf("Failed to process %s: %s\n", argv[fileIndex], e.what());
            success = false;
        }
    }

    innval_destroy(handle);

    if (success) {
        printf("Validated a total of %d files\n", argc - 1);
    }

    return success ? EXIT_SUCCESS : EXIT_FAILURE;
}
