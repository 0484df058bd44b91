/// @file tests/core/test_data_loader.cpp
/// @brief DataLoader CSV parsing.

#include "finrep/data_loader.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace finrep;
using namespace finrep::core;

// ─── parse_amount ─────────────────────────────────────────────────────────────

TEST(DataLoader_ParseAmount, PlainIntegers) {
    EXPECT_EQ(*DataLoader::parse_amount("0"), 0);
    EXPECT_EQ(*DataLoader::parse_amount("12345"), 12345);
    EXPECT_EQ(*DataLoader::parse_amount("-987"), -987);
    EXPECT_EQ(*DataLoader::parse_amount("+5"), 5);
}

TEST(DataLoader_ParseAmount, BeyondSixtyFourBits) {
    // 2^64 = 18446744073709551616
    const auto v = DataLoader::parse_amount("18446744073709551616");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, static_cast<Amount>(1) << 64);
}

TEST(DataLoader_ParseAmount, Int128Extremes) {
    const auto max = DataLoader::parse_amount("170141183460469231731687303715884105727");
    const auto min = DataLoader::parse_amount("-170141183460469231731687303715884105728");
    ASSERT_TRUE(max.has_value());
    ASSERT_TRUE(min.has_value());
    EXPECT_GT(*max, 0);
    EXPECT_LT(*min, 0);
    EXPECT_EQ(*max + *min, -1);
}

TEST(DataLoader_ParseAmount, OutOfRange_Rejected) {
    EXPECT_FALSE(DataLoader::parse_amount("170141183460469231731687303715884105728").has_value());
    EXPECT_FALSE(DataLoader::parse_amount("-170141183460469231731687303715884105729").has_value());
}

TEST(DataLoader_ParseAmount, Garbage_Rejected) {
    EXPECT_FALSE(DataLoader::parse_amount("").has_value());
    EXPECT_FALSE(DataLoader::parse_amount("-").has_value());
    EXPECT_FALSE(DataLoader::parse_amount("12a").has_value());
    EXPECT_FALSE(DataLoader::parse_amount("1.5").has_value());
    EXPECT_FALSE(DataLoader::parse_amount(" 7").has_value());
}

// ─── split_fields ─────────────────────────────────────────────────────────────

TEST(DataLoader_SplitFields, TrimsAndKeepsEmptyFields) {
    const auto f = DataLoader::split_fields(" a ,, c,");
    ASSERT_EQ(f.size(), 4u);
    EXPECT_EQ(f[0], "a");
    EXPECT_EQ(f[1], "");
    EXPECT_EQ(f[2], "c");
    EXPECT_EQ(f[3], "");
}

// ─── goals ────────────────────────────────────────────────────────────────────

TEST(DataLoader_Goals, ParsesValidRowsAndSkipsBadOnes) {
    const std::string csv =
        "id,owner,name,target_amount,current_amount,target_date,locked\n"
        "1,alice,Emergency,1000,250,1700000000,true\n"
        "# comment line\n"
        "\n"
        "2,alice,Car,notanumber,0,1700000000,0\n"
        "3,bob,House,5000,5000,1800000000,0\r\n";

    const auto goals = DataLoader::parse_goals_csv(csv);
    ASSERT_EQ(goals.size(), 2u);
    EXPECT_EQ(goals[0].id, 1u);
    EXPECT_EQ(goals[0].owner.value, "alice");
    EXPECT_EQ(goals[0].name, "Emergency");
    EXPECT_EQ(goals[0].target_amount, 1000);
    EXPECT_EQ(goals[0].current_amount, 250);
    EXPECT_TRUE(goals[0].locked);
    EXPECT_EQ(goals[1].owner.value, "bob");
    EXPECT_FALSE(goals[1].locked);
}

TEST(DataLoader_Goals, HeaderOnly_Empty) {
    EXPECT_TRUE(DataLoader::parse_goals_csv(
        "id,owner,name,target_amount,current_amount,target_date,locked\n").empty());
    EXPECT_TRUE(DataLoader::parse_goals_csv("").empty());
}

// ─── bills ────────────────────────────────────────────────────────────────────

TEST(DataLoader_Bills, PaidAtOptional) {
    const std::string csv =
        "id,owner,name,amount,due_date,recurring,frequency_days,paid,created_at,paid_at\n"
        "1,alice,Rent,1200,500,1,30,1,100,450\n"
        "2,alice,Power,80,600,0,0,0,120,\n"
        "3,alice,Water,40,600,0,0,0,120,soon\n";

    const auto bills = DataLoader::parse_bills_csv(csv);
    ASSERT_EQ(bills.size(), 2u);
    EXPECT_TRUE(bills[0].paid);
    ASSERT_TRUE(bills[0].paid_at.has_value());
    EXPECT_EQ(*bills[0].paid_at, 450u);
    EXPECT_TRUE(bills[0].recurring);
    EXPECT_EQ(bills[0].frequency_days, 30u);
    EXPECT_FALSE(bills[1].paid);
    EXPECT_FALSE(bills[1].paid_at.has_value());
    EXPECT_EQ(bills[1].created_at, 120u);
}

TEST(DataLoader_Bills, WrongFieldCount_Skipped) {
    const std::string csv =
        "header\n"
        "1,alice,Rent,1200,500,1,30,1,100\n";
    EXPECT_TRUE(DataLoader::parse_bills_csv(csv).empty());
}

// ─── policies ─────────────────────────────────────────────────────────────────

TEST(DataLoader_Policies, ParsesRow) {
    const std::string csv =
        "id,owner,name,coverage_type,monthly_premium,coverage_amount,active,next_payment_date\n"
        "7,alice,Family Health,health,150,90000,true,1700000000\n";

    const auto policies = DataLoader::parse_policies_csv(csv);
    ASSERT_EQ(policies.size(), 1u);
    EXPECT_EQ(policies[0].id, 7u);
    EXPECT_EQ(policies[0].coverage_type, "health");
    EXPECT_EQ(policies[0].monthly_premium, 150);
    EXPECT_EQ(policies[0].coverage_amount, 90000);
    EXPECT_TRUE(policies[0].active);
}

// ─── split ────────────────────────────────────────────────────────────────────

TEST(DataLoader_Split, OnePercentagePerRow) {
    const auto split = DataLoader::parse_split_csv("percentage\n50\n30\n-1\n15\n5\n");
    ASSERT_EQ(split.size(), 4u);
    EXPECT_EQ(split[0], 50u);
    EXPECT_EQ(split[3], 5u);
}

// ─── read_file ────────────────────────────────────────────────────────────────

TEST(DataLoader_ReadFile, MissingFile_ReturnsNullopt) {
    EXPECT_FALSE(DataLoader::read_file("/nonexistent/finrep/goals.csv").has_value());
}
