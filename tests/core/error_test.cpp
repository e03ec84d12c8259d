#include <gtest/gtest.h>
#include <rcs/core/error.hpp>

#include <memory>

namespace rcs::core::test {

TEST(ErrorTest, BasicErrorCode) {
    std::error_code ec = make_error_code(ErrorCode::InvalidArgument);
    EXPECT_EQ(ec.message(), "Invalid argument");
    EXPECT_STREQ(ec.category().name(), "rcs");
}

TEST(ErrorTest, ErrorConditionMapping) {
    EXPECT_TRUE(make_error_code(ErrorCode::FileNotFound) == std::errc::no_such_file_or_directory);
    EXPECT_TRUE(make_error_code(ErrorCode::Timeout) == std::errc::timed_out);
    EXPECT_TRUE(make_error_code(ErrorCode::ContentTooLarge) == std::errc::file_too_large);
}

TEST(ErrorTest, ErrorException) {
    try {
        throw Error(ErrorCode::NetworkError, "Failed to send BYE");
        FAIL() << "Expected Error exception";
    }
    catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::NetworkError);
        EXPECT_STREQ(e.what(), "Failed to send BYE");
        EXPECT_TRUE(e.error_code() == std::errc::network_unreachable);
        EXPECT_GT(e.location().line(), 0u);
    }
}

TEST(ErrorTest, ThrowErrorHelper) {
    try {
        throw_error(ErrorCode::SessionNotFound, "No such session");
        FAIL() << "Expected Error exception";
    }
    catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::SessionNotFound);
        EXPECT_STREQ(e.what(), "No such session");
    }
}

TEST(ErrorTest, ResultSuccess) {
    Result<int> result = 42;
    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_error());
    EXPECT_EQ(result.value(), 42);
}

TEST(ErrorTest, ResultError) {
    Result<int> result(ErrorCode::InvalidData, "Invalid integer");
    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidData);
    EXPECT_THROW(result.value(), Error);
}

TEST(ErrorTest, ResultVoid) {
    Result<void> result;
    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_error());
    EXPECT_NO_THROW(result.value());
    EXPECT_THROW(result.error(), Error);
}

TEST(ErrorTest, ResultVoidError) {
    Result<void> result(ErrorCode::NotSupported, "Feature not supported");
    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), ErrorCode::NotSupported);
    EXPECT_THROW(result.value(), Error);
}

TEST(ErrorTest, ResultFromError) {
    Error error(ErrorCode::ContentExpired, "Expired");
    Result<void> result(error);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), ErrorCode::ContentExpired);
}

TEST(ErrorTest, ResultMoveValue) {
    Result<std::unique_ptr<int>> result(std::make_unique<int>(42));
    EXPECT_TRUE(result.is_ok());
    auto ptr = std::move(result).value();
    EXPECT_EQ(*ptr, 42);
}

TEST(ErrorTest, ResultBoolConversion) {
    Result<int> success(42);
    Result<int> failure(ErrorCode::InvalidData, "Invalid integer");
    EXPECT_TRUE(static_cast<bool>(success));
    EXPECT_FALSE(static_cast<bool>(failure));
}

} // namespace rcs::core::test
