// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string_view>

#include "category.hpp"
#include "checksum/inn_checksum.hpp"

#include "common/gtest_utils.hpp"

using namespace innval;
using namespace innval::test;

namespace {

constexpr std::string_view base_dir = "integration/vectors/";

TEST(TestVectorsIntegration, Validation)
{
    auto vectors = read_vectors<validation_vector>("inn_vectors.yaml", "validation", base_dir);
    ASSERT_FALSE(vectors.empty());

    for (const auto &v : vectors) {
        EXPECT_EQ(validate(v.input), v.valid) << "input: '" << v.input << "'";
        EXPECT_EQ(innval_validate(v.input.data(), v.input.size()), v.valid)
            << "input: '" << v.input << "'";
        EXPECT_STRV(inn_category_to_string(classify(v.input)), v.category)
            << "input: '" << v.input << "'";
    }
}

TEST(TestVectorsIntegration, Search)
{
    auto vectors = read_vectors<search_vector>("inn_vectors.yaml", "search", base_dir);
    ASSERT_FALSE(vectors.empty());

    innval_handle handle = innval_init(nullptr);
    ASSERT_NE(handle, nullptr);

    for (const auto &v : vectors) {
        std::size_t offset = 0;
        std::size_t length = 0;
        auto found = innval_search(handle, v.text.data(), v.text.size(), &offset, &length);

        ASSERT_EQ(found, v.match.has_value()) << "text: '" << v.text << "'";
        if (found) {
            EXPECT_STRV(std::string_view{v.text}.substr(offset, length), *v.match);
        }
    }

    innval_destroy(handle);
}

} // namespace
