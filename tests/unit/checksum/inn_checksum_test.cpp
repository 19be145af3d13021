// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <string>

#include "checksum/inn_checksum.hpp"

#include "common/gtest_utils.hpp"

using namespace innval;

namespace {

TEST(TestInnChecksum, Organization)
{
    EXPECT_TRUE(inn_checksum{}.validate("7830002293"));
    EXPECT_TRUE(inn_checksum{}.validate("7707083893"));
    EXPECT_TRUE(inn_checksum{}.validate("7736207543"));

    EXPECT_FALSE(inn_checksum{}.validate("7830002294"));
    EXPECT_FALSE(inn_checksum{}.validate("7707083890"));
}

TEST(TestInnChecksum, Individual)
{
    EXPECT_TRUE(inn_checksum{}.validate("500100732259"));
    EXPECT_TRUE(inn_checksum{}.validate("770708389324"));

    EXPECT_FALSE(inn_checksum{}.validate("500111732259"));
    // Valid n2, invalid n1
    EXPECT_FALSE(inn_checksum{}.validate("500100732258"));
    // Invalid n2, valid n1 for the altered n2
    EXPECT_FALSE(inn_checksum{}.validate("770708389314"));
}

TEST(TestInnChecksum, ControlDigitOverflow)
{
    // Organization checksum 2 + 8 = 10
    EXPECT_EQ(compute_control_digit("100000001", inn_coefficients::organization), 0);
    EXPECT_TRUE(inn_checksum{}.validate("1000000010"));
    EXPECT_FALSE(inn_checksum{}.validate("1000000011"));

    // Individual n2 checksum 7 + 6 + 8 = 21
    EXPECT_EQ(compute_control_digit("1000000011", inn_coefficients::individual_n2), 0);
    EXPECT_TRUE(inn_checksum{}.validate("100000001102"));

    // Individual n1 checksum 3 + 42 + 64 = 109
    EXPECT_EQ(compute_control_digit("10000000078", inn_coefficients::individual_n1), 0);
    EXPECT_TRUE(inn_checksum{}.validate("100000000780"));
    EXPECT_FALSE(inn_checksum{}.validate("100000000781"));
}

TEST(TestInnChecksum, ComputeControlDigit)
{
    EXPECT_EQ(compute_control_digit("783000229", inn_coefficients::organization), 3);
    EXPECT_EQ(compute_control_digit("5001007322", inn_coefficients::individual_n2), 5);
    EXPECT_EQ(compute_control_digit("50010073225", inn_coefficients::individual_n1), 9);
    EXPECT_EQ(compute_control_digit("", inn_coefficients::organization), 0);
}

TEST(TestInnChecksum, InvalidLength)
{
    EXPECT_FALSE(inn_checksum{}.validate(""));
    EXPECT_FALSE(inn_checksum{}.validate("            "));
    EXPECT_FALSE(inn_checksum{}.validate("783000229"));
    EXPECT_FALSE(inn_checksum{}.validate("78300022930"));
    EXPECT_FALSE(inn_checksum{}.validate("5001007322590"));
}

TEST(TestInnChecksum, Whitespace)
{
    EXPECT_TRUE(inn_checksum{}.validate(" 7830002293 "));
    EXPECT_TRUE(inn_checksum{}.validate("\t\n500100732259\r\v\f"));
    EXPECT_FALSE(inn_checksum{}.validate(" 7830002294 "));

    // Only surrounding whitespace is ignored
    EXPECT_FALSE(inn_checksum{}.validate("78300 02293"));
}

TEST(TestInnChecksum, NonDigitCharacters)
{
    EXPECT_FALSE(inn_checksum{}.validate("78300O2293"));
    EXPECT_FALSE(inn_checksum{}.validate("783000229a"));
    EXPECT_FALSE(inn_checksum{}.validate("-783000229"));
    EXPECT_FALSE(inn_checksum{}.validate("5001-0732259"));
    EXPECT_FALSE(inn_checksum{}.validate(std::string{"78300\0" "2293", 10}));
}

TEST(TestInnChecksum, SingleDigitMutation)
{
    const std::string organization = "7830002293";
    const std::string individual = "500100732259";

    for (std::size_t i = 0; i < organization.size() - 1; ++i) {
        auto mutated = organization;
        for (char c = '0'; c <= '9'; ++c) {
            if (c == organization[i]) {
                continue;
            }
            mutated[i] = c;
            EXPECT_FALSE(inn_checksum{}.validate(mutated)) << mutated;
        }
    }

    for (std::size_t i = 0; i < individual.size() - 2; ++i) {
        auto mutated = individual;
        for (char c = '0'; c <= '9'; ++c) {
            if (c == individual[i]) {
                continue;
            }
            mutated[i] = c;
            EXPECT_FALSE(inn_checksum{}.validate(mutated)) << mutated;
        }
    }
}

TEST(TestInnChecksum, CategoryRestriction)
{
    inn_checksum organization{static_cast<category_set>(inn_category::organization)};
    EXPECT_TRUE(organization.validate("7830002293"));
    EXPECT_FALSE(organization.validate("500100732259"));

    inn_checksum individual{static_cast<category_set>(inn_category::individual)};
    EXPECT_FALSE(individual.validate("7830002293"));
    EXPECT_TRUE(individual.validate("500100732259"));

    inn_checksum none{0};
    EXPECT_FALSE(none.validate("7830002293"));
    EXPECT_FALSE(none.validate("500100732259"));
}

TEST(TestInnChecksum, Idempotence)
{
    const inn_checksum checksum;
    for (unsigned i = 0; i < 3; ++i) {
        EXPECT_TRUE(checksum.validate("7830002293"));
        EXPECT_FALSE(checksum.validate("7830002294"));
        EXPECT_TRUE(validate("500100732259"));
        EXPECT_FALSE(validate("500111732259"));
    }
}

} // namespace
