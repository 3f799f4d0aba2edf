// SPDX-License-Identifier: MIT

// tests/transfer_options_test.cpp
#include <gtest/gtest.h>

#include <chrono>

#include "lib/stream/transfer_options.hpp"

using namespace sockstream;

TEST(TransferOptionsTest, Defaults) {
    TransferOptions options;
    EXPECT_EQ(options.offset, 0u);
    EXPECT_FALSE(options.size.has_value());
    EXPECT_FALSE(options.chunk_size.has_value());
    EXPECT_FALSE(options.timeout.has_value());
    EXPECT_EQ(options.ChunkSize(), kDefaultChunkSize);
    EXPECT_EQ(kDefaultChunkSize, 4096u);
}

TEST(TransferOptionsTest, DesignatedInitializers) {
    TransferOptions options{.offset = 100, .size = 500, .chunk_size = 256};
    EXPECT_EQ(options.offset, 100u);
    EXPECT_EQ(options.size, 500u);
    EXPECT_EQ(options.ChunkSize(), 256u);

    TransferOptions receive{.timeout = std::chrono::milliseconds{250}};
    EXPECT_EQ(receive.timeout, std::chrono::milliseconds{250});
}
