#include "ingest/core/result.hpp"

#include <gtest/gtest.h>

#include <string>

using ingest::Err;
using ingest::Error;
using ingest::ErrorCode;
using ingest::Ok;
using ingest::Result;

namespace {

Result<int> parse_positive(int value) {
    if (value <= 0) {
        return Err<int>(ErrorCode::InvalidArgument, "not positive: " + std::to_string(value));
    }
    return Ok(value);
}

} // namespace

TEST(ResultTest, CarriesValueOrError) {
    auto good = parse_positive(3);
    ASSERT_TRUE(good.is_ok());
    EXPECT_EQ(good.value(), 3);

    auto bad = parse_positive(-1);
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(bad.value_or(10), 10);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok = Ok();
    EXPECT_TRUE(ok.is_ok());

    Result<void> failed = Err<void>(ErrorCode::ArchiveFailed, "disk full");
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().message, "disk full");
}

TEST(ResultTest, SameValueAndErrorTypeStayDistinct) {
    Result<std::string, std::string> value(ingest::OkValue<std::string>("fine"));
    Result<std::string, std::string> error(ingest::ErrValue<std::string>("broken"));

    EXPECT_TRUE(value.is_ok());
    EXPECT_EQ(value.value(), "fine");
    EXPECT_TRUE(error.is_error());
    EXPECT_EQ(error.error(), "broken");
}

TEST(ResultTest, RewrapKeepsCause) {
    Error inner(ErrorCode::Timeout, "no response within 600000ms");
    Error outer = inner.rewrap(ErrorCode::TransferFailed, "jobA");

    EXPECT_EQ(outer.code, ErrorCode::TransferFailed);
    EXPECT_EQ(outer.message, "jobA: no response within 600000ms");
    EXPECT_EQ(outer.describe(), "TransferFailed: jobA: no response within 600000ms");
}
