// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include "../common/afl_wrapper.hpp"
#include "../common/utils.hpp"
#include "category.hpp"
#include "checksum/inn_checksum.hpp"
#include "innval.h"
#include <cstdint>
#include <cstdlib>

using namespace innval_afl;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
    InputSplitter splitter(data, size);

    innval_config config{splitter.get<uint8_t>() & 0x03U, nullptr};
    auto input = splitter.get_remaining();

    bool valid = innval::validate(input);
    prevent_optimization(valid);

    // A valid number always has a supported length
    if (valid && innval::classify(input) == innval::inn_category::invalid) {
        abort();
    }

    innval_handle handle = innval_init(&config);
    if (handle == nullptr) {
        abort();
    }

    std::size_t offset = 0;
    std::size_t length = 0;
    if (innval_search(handle, input.data(), input.size(), &offset, &length)) {
        // Anything found must validate on its own
        if (offset + length > input.size() ||
            !innval_handle_validate(handle, input.data() + offset, length)) {
            abort();
        }
    }

    innval_destroy(handle);

    return 0;
}

AFL_FUZZ_TARGET("inn_checksum_fuzz", LLVMFuzzerTestOneInput)
