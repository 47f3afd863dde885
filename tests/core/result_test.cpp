#include "fieldsync/core/result.hpp"

#include <gtest/gtest.h>

#include <string>

using fieldsync::Err;
using fieldsync::Error;
using fieldsync::ErrorKind;
using fieldsync::Ok;
using fieldsync::Result;

namespace {

Result<int> parse_positive(int value) {
    if (value <= 0) {
        return Err<int>(ErrorKind::InvalidArgument, "not positive");
    }
    return Ok(value);
}

Result<void> check(bool ok) {
    if (!ok) {
        return Err<void>(ErrorKind::Storage, "disk full");
    }
    return Ok();
}

} // namespace

TEST(ResultTest, HoldsValueOrError) {
    auto ok = parse_positive(7);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), 7);

    auto bad = parse_positive(-1);
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(bad.value_or(42), 42);
}

TEST(ResultTest, VoidResult) {
    EXPECT_TRUE(check(true).is_ok());

    auto failed = check(false);
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().message, "disk full");
}

TEST(ResultTest, CustomErrorType) {
    Result<bool, std::string> ok = Ok(true);
    EXPECT_TRUE(ok.value());

    auto bad = Err<bool, std::string>(std::string("broken"));
    EXPECT_EQ(bad.error(), "broken");
}

TEST(ErrorTest, RetryClassification) {
    EXPECT_TRUE(fieldsync::is_retryable(ErrorKind::Transient));
    EXPECT_TRUE(fieldsync::is_retryable(ErrorKind::Timeout));
    EXPECT_FALSE(fieldsync::is_retryable(ErrorKind::Rejected));
    EXPECT_FALSE(fieldsync::is_retryable(ErrorKind::Authentication));

    EXPECT_TRUE(fieldsync::is_fatal_to_cycle(ErrorKind::Authentication));
    EXPECT_FALSE(fieldsync::is_fatal_to_cycle(ErrorKind::Transient));

    EXPECT_EQ(fieldsync::describe(Error{ErrorKind::Timeout, "slow"}), "timeout: slow");
}
