#include <gtest/gtest.h>
#include "input_validator.hpp"

TEST(InputValidatorTest, ValidCoil) {
    auto result = InputValidator::validate(Coil{1250, 3000});
    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.reason, "");
}

TEST(InputValidatorTest, ZeroWidthCoilIsValid) {
    auto result = InputValidator::validate(Coil{0, 3000});
    EXPECT_TRUE(result.valid);
}

TEST(InputValidatorTest, NegativeCoilWidth) {
    auto result = InputValidator::validate(Coil{-10, 3000});
    EXPECT_FALSE(result.valid);
    EXPECT_NE(result.reason.find("width"), std::string::npos);
}

TEST(InputValidatorTest, NegativeCoilLength) {
    auto result = InputValidator::validate(Coil{100, -1});
    EXPECT_FALSE(result.valid);
    EXPECT_NE(result.reason.find("length"), std::string::npos);
}

TEST(InputValidatorTest, InvalidOrderWidthZero) {
    auto result = InputValidator::validate(Order{0, 5});
    EXPECT_FALSE(result.valid);
    EXPECT_NE(result.reason.find("positive"), std::string::npos);
}

TEST(InputValidatorTest, ZeroLengthOrderIsValid) {
    auto result = InputValidator::validate(Order{30, 0});
    EXPECT_TRUE(result.valid);
}

TEST(InputValidatorTest, CatalogIssuesKeepIndices) {
    std::vector<Order> orders = {
        {30, 5},
        {-4, 3},
        {50, 6},
        {20, -2}
    };

    auto issues = InputValidator::validate(orders);

    ASSERT_EQ(issues.size(), 2);
    EXPECT_EQ(issues[0].record, "order");
    EXPECT_EQ(issues[0].index, 1);
    EXPECT_EQ(issues[1].index, 3);
    EXPECT_NE(issues[1].reason.find("negative"), std::string::npos);
}
