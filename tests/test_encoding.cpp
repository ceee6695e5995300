// This file is part of reiter and is distributed under the MIT license, see LICENSE.md
#include "encoding.hpp"

#include <gtest/gtest.h>

#include <string>

static size_t sequenceLength(const std::string& text, size_t offset = 0)
{
	return getUTF8SequenceLength(text.data(), text.size(), offset);
}

TEST(Encoding, WellFormedSequences)
{
	EXPECT_EQ(1u, sequenceLength("a"));
	EXPECT_EQ(1u, sequenceLength(std::string(1, '\0')));
	EXPECT_EQ(2u, sequenceLength("\xC3\xA9"));
	EXPECT_EQ(3u, sequenceLength("\xE2\x82\xAC"));
	EXPECT_EQ(3u, sequenceLength("\xEF\xBF\xBF"));
	EXPECT_EQ(4u, sequenceLength("\xF0\x9F\x98\x80"));
	EXPECT_EQ(4u, sequenceLength("\xF4\x8F\xBF\xBF"));
}

TEST(Encoding, MalformedSequences)
{
	// continuation byte
	EXPECT_EQ(0u, sequenceLength("\x80"));
	// overlong forms
	EXPECT_EQ(0u, sequenceLength("\xC0\xAF"));
	EXPECT_EQ(0u, sequenceLength("\xE0\x80\xAF"));
	EXPECT_EQ(0u, sequenceLength("\xF0\x80\x80\xAF"));
	// surrogate
	EXPECT_EQ(0u, sequenceLength("\xED\xA0\x80"));
	// above U+10FFFF
	EXPECT_EQ(0u, sequenceLength("\xF4\x90\x80\x80"));
	EXPECT_EQ(0u, sequenceLength("\xFF"));
	// truncated
	EXPECT_EQ(0u, sequenceLength("\xE2\x82"));
	EXPECT_EQ(0u, sequenceLength("\xC3" "a"));
}

TEST(Encoding, Offsets)
{
	std::string text = "a\xC3\xA9" "b";

	EXPECT_EQ(1u, sequenceLength(text, 0));
	EXPECT_EQ(2u, sequenceLength(text, 1));
	EXPECT_EQ(0u, sequenceLength(text, 2));
	EXPECT_EQ(1u, sequenceLength(text, 3));
	EXPECT_EQ(0u, sequenceLength(text, 4));
}

TEST(Encoding, CodepointWidth)
{
	std::string text = "a\xC3\xA9\x80";

	EXPECT_EQ(1u, getCodepointWidth(text.data(), text.size(), 0));
	EXPECT_EQ(2u, getCodepointWidth(text.data(), text.size(), 1));
	EXPECT_EQ(1u, getCodepointWidth(text.data(), text.size(), 2));
	EXPECT_EQ(1u, getCodepointWidth(text.data(), text.size(), 3));
	EXPECT_EQ(1u, getCodepointWidth(text.data(), text.size(), 4));
	EXPECT_EQ(1u, getCodepointWidth(text.data(), text.size(), 10));
}
