#include <gtest/gtest.h>
#include "shardex/error_handling.hpp"
#include <string>

using namespace shardex;

class ErrorHandlingTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(ErrorHandlingTest, ErrorCodeConversion) {
    auto ec = make_error_code(ErrorCode::ORDER_NOT_FOUND);
    EXPECT_EQ(ec.value(), static_cast<int>(ErrorCode::ORDER_NOT_FOUND));
    EXPECT_EQ(ec.category().name(), std::string("shardex"));
    EXPECT_EQ(ec.message(), "Order not found");

    // Implicit conversion through is_error_code_enum
    std::error_code converted = ErrorCode::SHARD_BUSY;
    EXPECT_EQ(converted, make_error_code(ErrorCode::SHARD_BUSY));
    EXPECT_NE(converted, make_error_code(ErrorCode::ORDER_INVALID));
}

TEST_F(ErrorHandlingTest, EveryCodeHasAMessage) {
    for (auto code : {ErrorCode::ORDER_INVALID, ErrorCode::ORDER_DUPLICATE, ErrorCode::ORDER_NOT_FOUND,
                      ErrorCode::RISK_LIMIT_EXCEEDED, ErrorCode::POSITION_LIMIT_EXCEEDED,
                      ErrorCode::MEMORY_POOL_EXHAUSTED, ErrorCode::SHARD_BUSY, ErrorCode::FILE_NOT_FOUND,
                      ErrorCode::CONFIG_INVALID, ErrorCode::CONFIG_INTEGRITY_FAILED,
                      ErrorCode::INTERNAL_INVARIANT_VIOLATION}) {
        EXPECT_NE(make_error_code(code).message(), "Unknown error") << static_cast<int>(code);
    }
    EXPECT_EQ(error_category().message(42), "Unknown error");
}

TEST_F(ErrorHandlingTest, ResultMonadSuccess) {
    Result<int> success_result(42);

    EXPECT_TRUE(success_result.has_value());
    EXPECT_FALSE(success_result.has_error());
    EXPECT_EQ(success_result.value(), 42);
    EXPECT_FALSE(success_result.is(ErrorCode::ORDER_INVALID));

    auto mapped = success_result.map([](int x) { return x * 2; });
    EXPECT_TRUE(mapped.has_value());
    EXPECT_EQ(mapped.value(), 84);
}

TEST_F(ErrorHandlingTest, ResultMonadError) {
    Result<int> error_result(ErrorCode::RISK_LIMIT_EXCEEDED);

    EXPECT_FALSE(error_result.has_value());
    EXPECT_TRUE(error_result.has_error());
    EXPECT_TRUE(error_result.is(ErrorCode::RISK_LIMIT_EXCEEDED));
    EXPECT_FALSE(error_result.is(ErrorCode::POSITION_LIMIT_EXCEEDED));
    EXPECT_THROW(error_result.value(), std::runtime_error);

    auto mapped = error_result.map([](int x) { return x * 2; });
    EXPECT_TRUE(mapped.has_error());
    EXPECT_EQ(mapped.error(), error_result.error());
}

TEST_F(ErrorHandlingTest, ResultVoidSpecialization) {
    Result<void> success_result;
    EXPECT_TRUE(success_result.has_value());
    EXPECT_FALSE(success_result.has_error());
    EXPECT_TRUE(static_cast<bool>(success_result));

    Result<void> error_result(ErrorCode::CONFIG_INTEGRITY_FAILED);
    EXPECT_FALSE(error_result.has_value());
    EXPECT_TRUE(error_result.has_error());
    EXPECT_EQ(error_result.error().value(), static_cast<int>(ErrorCode::CONFIG_INTEGRITY_FAILED));
}

TEST_F(ErrorHandlingTest, ResultMovesValueOut) {
    Result<std::string> result(std::string("payload"));
    std::string taken = std::move(result).value();
    EXPECT_EQ(taken, "payload");
}
