// Copyright 2025 The Spin Demos Authors
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "text_buffer.hpp"

#include <gtest/gtest.h>

#include <string>

using spin::TextBuffer;

TEST(TextBufferTest, AppendsPastInitialStorage) {
	char data[4];
	TextBuffer buffer{data};
	buffer.Append("Hello, ");
	buffer.Append(std::string_view{"world"});
	buffer.AppendChar('!');
	EXPECT_EQ(buffer.Contents(), "Hello, world!");
	EXPECT_EQ(buffer.Size(), 13u);
}

TEST(TextBufferTest, ClearKeepsStorage) {
	TextBuffer buffer;
	buffer.Append("some text");
	buffer.Clear();
	EXPECT_EQ(buffer.Size(), 0u);
	EXPECT_GE(buffer.Avail(), 9u);
	buffer.Append("x");
	EXPECT_EQ(buffer.Contents(), "x");
}

TEST(TextBufferTest, AppendsNumbersAndBools) {
	TextBuffer buffer;
	buffer.AppendNumber(-42);
	buffer.AppendChar(' ');
	buffer.AppendNumber(7u);
	buffer.AppendChar(' ');
	buffer.AppendNumber(0.5);
	buffer.AppendChar(' ');
	buffer.AppendNumber(1.25f);
	buffer.AppendChar(' ');
	buffer.AppendBool(true);
	buffer.AppendChar(' ');
	buffer.AppendBool(false);
	EXPECT_EQ(buffer.Contents(), "-42 7 0.5 1.25 true false");
}

TEST(TextBufferTest, QuotesAndEscapesControlCharacters) {
	TextBuffer buffer;
	buffer.AppendQuoted("tab\there \"q\" back\\slash\nnew\x01");
	EXPECT_EQ(buffer.Contents(),
	          "\"tab\\there \\\"q\\\" back\\\\slash\\nnew\\x01\"");
}

TEST(TextBufferTest, EscapesNonASCIIBytes) {
	TextBuffer buffer;
	buffer.AppendEscaped("caf\xc3\xa9 \x7f");
	EXPECT_EQ(buffer.Contents(), "caf\\xc3\\xa9 \\x7f");
}

TEST(TextBufferTest, ReserveMovesToHeap) {
	char data[8];
	TextBuffer buffer{data};
	buffer.Append("1234");
	buffer.Reserve(100);
	EXPECT_GE(buffer.Avail(), 100u);
	EXPECT_NE(buffer.Start(), data);
	EXPECT_EQ(buffer.Contents(), "1234");
}

TEST(TextBufferTest, NumbersGrowEmptyBuffer) {
	TextBuffer buffer;
	buffer.AppendNumber(-9223372036854775807LL - 1);
	EXPECT_EQ(buffer.Contents(), "-9223372036854775808");
}
