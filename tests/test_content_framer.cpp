//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_content_framer.cpp
// Purpose: Tests for outbound frame encoders
//==========================================================================================================

#include <gtest/gtest.h>

#include "toolrpc/ContentFramer.h"

namespace toolrpc {

TEST(ContentFramer, ContentLengthEncodesHeaderAndBody) {
    auto f = MakeContentLengthFramer();
    EXPECT_EQ(f->mode(), FramingMode::ContentLength);
    EXPECT_EQ(f->encode("{\"a\":1}"), "Content-Length: 7\r\n\r\n{\"a\":1}");
}

TEST(ContentFramer, ContentLengthCountsBytesNotCharacters) {
    auto f = MakeContentLengthFramer();
    // "é" is two bytes in UTF-8
    EXPECT_EQ(f->encode("\"\xC3\xA9\""), "Content-Length: 4\r\n\r\n\"\xC3\xA9\"");
}

TEST(ContentFramer, NewlineAppendsTerminator) {
    auto f = MakeNewlineFramer();
    EXPECT_EQ(f->mode(), FramingMode::Newline);
    EXPECT_EQ(f->encode("{}"), "{}\n");
    EXPECT_EQ(f->encode(""), "\n");
}

TEST(ContentFramer, FactorySelectsByMode) {
    EXPECT_EQ(MakeFramer(FramingMode::ContentLength)->mode(), FramingMode::ContentLength);
    EXPECT_EQ(MakeFramer(FramingMode::Newline)->mode(), FramingMode::Newline);
}

TEST(ContentFramer, ModeFromString) {
    EXPECT_EQ(FramingModeFromString("content-length"), FramingMode::ContentLength);
    EXPECT_EQ(FramingModeFromString("Content_Length"), FramingMode::ContentLength);
    EXPECT_EQ(FramingModeFromString("1"), FramingMode::ContentLength);
    EXPECT_EQ(FramingModeFromString("newline"), FramingMode::Newline);
    EXPECT_EQ(FramingModeFromString("bogus"), FramingMode::Newline);
}

} // namespace toolrpc
