#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "trade_sim/core/error.hpp"

using namespace trade_sim;

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);

    Result<std::string> string_result("success");
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "success");

    Result<double> double_result(3.14);
    EXPECT_DOUBLE_EQ(double_result.value(), 3.14);
}

TEST_F(ResultTest, ErrorCase) {
    auto error_result =
        make_error<int>(ErrorCode::INVALID_DATA, "Duplicate bar", "PriceSeriesIndex");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::INVALID_DATA);
    EXPECT_STREQ(error_result.error()->what(), "Duplicate bar");
    EXPECT_EQ(error_result.error()->component(), "PriceSeriesIndex");
    EXPECT_EQ(error_result.error()->to_string(),
              "Error in PriceSeriesIndex: Duplicate bar (INVALID_DATA)");
}

TEST_F(ResultTest, ValueOnErrorThrows) {
    auto error_result = make_error<double>(ErrorCode::INSUFFICIENT_HISTORY, "No ATR", "Sizer");
    EXPECT_THROW(error_result.value(), TradeError);

    try {
        error_result.value();
        FAIL() << "value() should throw";
    } catch (const TradeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INSUFFICIENT_HISTORY);
    }
}

TEST_F(ResultTest, MoveOnlyType) {
    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> result(std::move(ptr));

    EXPECT_TRUE(result.is_ok());
    EXPECT_EQ(*result.value(), 42);

    std::unique_ptr<int> taken = result.take_value();
    ASSERT_NE(taken, nullptr);
    EXPECT_EQ(*taken, 42);
}

TEST_F(ResultTest, MoveSemantics) {
    Result<std::vector<int>> vec_result(std::vector<int>{1, 2, 3});
    Result<std::vector<int>> moved = std::move(vec_result);

    EXPECT_TRUE(moved.is_ok());
    EXPECT_EQ(moved.value().size(), 3u);
}

TEST_F(ResultTest, VoidResult) {
    Result<void> success;
    EXPECT_TRUE(success.is_ok());
    EXPECT_NO_THROW(success.value());

    auto error = make_error<void>(ErrorCode::INVALID_CONFIGURATION, "holding_period", "Config");
    EXPECT_TRUE(error.is_error());
    EXPECT_THROW(error.value(), TradeError);
}

TEST_F(ResultTest, ForwardErrorKeepsCodeAndMessage) {
    auto original = make_error<int>(ErrorCode::DATA_NOT_FOUND, "No bar", "PriceSeriesIndex");

    auto forwarded = forward_error<std::string>(original);
    ASSERT_TRUE(forwarded.is_error());
    EXPECT_EQ(forwarded.error()->code(), ErrorCode::DATA_NOT_FOUND);
    EXPECT_STREQ(forwarded.error()->what(), "No bar");
    EXPECT_EQ(forwarded.error()->component(), "PriceSeriesIndex");

    auto renamed = forward_error<std::string>(original, "TradeSimulator");
    EXPECT_EQ(renamed.error()->component(), "TradeSimulator");
}

TEST_F(ResultTest, ErrorCodeNames) {
    EXPECT_EQ(error_code_to_string(ErrorCode::INVALID_CONFIGURATION), "INVALID_CONFIGURATION");
    EXPECT_EQ(error_code_to_string(ErrorCode::INSUFFICIENT_HISTORY), "INSUFFICIENT_HISTORY");
    EXPECT_EQ(error_code_to_string(ErrorCode::CUSTOM_ERROR_START), "UNKNOWN_ERROR");
}
