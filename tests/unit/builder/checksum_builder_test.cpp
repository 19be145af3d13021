// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include "builder/checksum_builder.hpp"
#include "category.hpp"
#include "exception.hpp"

#include "common/gtest_utils.hpp"

using namespace innval;

namespace {

TEST(TestChecksumBuilder, BuildByName)
{
    auto inn = checksum_builder::build("inn");
    ASSERT_NE(inn, nullptr);
    EXPECT_TRUE(inn->validate("7830002293"));
    EXPECT_TRUE(inn->validate("500100732259"));

    auto organization = checksum_builder::build("inn_organization");
    ASSERT_NE(organization, nullptr);
    EXPECT_TRUE(organization->validate("7830002293"));
    EXPECT_FALSE(organization->validate("500100732259"));

    auto individual = checksum_builder::build("inn_individual");
    ASSERT_NE(individual, nullptr);
    EXPECT_FALSE(individual->validate("7830002293"));
    EXPECT_TRUE(individual->validate("500100732259"));
}

TEST(TestChecksumBuilder, UnknownName)
{
    EXPECT_THROW(checksum_builder::build("luhn"), parsing_error);
    EXPECT_THROW(checksum_builder::build(""), parsing_error);
    EXPECT_THROW(checksum_builder::build("INN"), parsing_error);

    try {
        checksum_builder::build("snils");
        FAIL() << "expected parsing_error";
    } catch (const parsing_error &e) {
        EXPECT_STR(e.what(), "unknown checksum algorithm: 'snils'");
    }
}

TEST(TestChecksumBuilder, BuildByCategories)
{
    auto all = checksum_builder::build(all_categories);
    EXPECT_TRUE(all->validate("7830002293"));
    EXPECT_TRUE(all->validate("500100732259"));

    // An empty mask accepts all categories
    auto empty = checksum_builder::build(category_set{0});
    EXPECT_TRUE(empty->validate("7830002293"));
    EXPECT_TRUE(empty->validate("500100732259"));

    auto individual =
        checksum_builder::build(static_cast<category_set>(inn_category::individual));
    EXPECT_FALSE(individual->validate("7830002293"));
    EXPECT_TRUE(individual->validate("500100732259"));

    EXPECT_THROW(checksum_builder::build(category_set{0x04}), parsing_error);
}

} // namespace
