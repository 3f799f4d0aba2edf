// SPDX-License-Identifier: MIT

// tests/error_test.cpp
#include <cerrno>
#include <cstring>

#include <gtest/gtest.h>

#include "lib/stream/error.hpp"

using namespace sockstream;

TEST(ErrorTest, Construction) {
    Error err{ErrorCode::ConnectionFailed, "connection refused"};
    EXPECT_EQ(err.code, ErrorCode::ConnectionFailed);
    EXPECT_EQ(err.message, "connection refused");
    EXPECT_EQ(err.os_errno, 0);
}

TEST(ErrorTest, WithErrno) {
    Error err{ErrorCode::ConnectionReset, "send() failed", EPIPE};
    EXPECT_EQ(err.code, ErrorCode::ConnectionReset);
    EXPECT_EQ(err.os_errno, EPIPE);
}

TEST(ErrorTest, SystemErrorNamesOperationAndReason) {
    Error err = SystemError(ErrorCode::FileError, "open(/missing)", ENOENT);
    EXPECT_EQ(err.code, ErrorCode::FileError);
    EXPECT_EQ(err.os_errno, ENOENT);
    EXPECT_EQ(err.message, std::string("open(/missing) failed: ") + std::strerror(ENOENT));
}

TEST(ErrorTest, CategoryString) {
    EXPECT_EQ(error_category(ErrorCode::InvalidArgument), "argument");

    // Connection category
    EXPECT_EQ(error_category(ErrorCode::ConnectionFailed), "connection");
    EXPECT_EQ(error_category(ErrorCode::ConnectionReset), "connection");
    EXPECT_EQ(error_category(ErrorCode::ShutdownFailed), "connection");

    EXPECT_EQ(error_category(ErrorCode::Timeout), "timeout");

    // Byte sources
    EXPECT_EQ(error_category(ErrorCode::FileError), "io");
    EXPECT_EQ(error_category(ErrorCode::SourceError), "io");

    EXPECT_EQ(error_category(ErrorCode::TlsError), "tls");
}

TEST(ErrorTest, ResultCarriesError) {
    Result<int> ok = 42;
    Result<int> failed = std::unexpected(Error{ErrorCode::Timeout, "timed out"});

    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, 42);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, ErrorCode::Timeout);
}
