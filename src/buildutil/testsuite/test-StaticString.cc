/*
 * Copyright (c) 2008-2014, Pedigree Developers
 *
 * Please see the CONTRIB file in the root of the source tree for a full
 * list of contributors.
 *
 * Permission to use, copy, modify, and distribute this software for any
 * purpose with or without fee is hereby granted, provided that the above
 * copyright notice and this permission notice appear in all copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
 * WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
 * MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
 * ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
 * WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN
 * ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
 * OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
 */

#define KEEL_EXTERNAL_SOURCE 1

#include <gtest/gtest.h>

#include <utilities/StaticString.h>

TEST(KeelStaticString, Construction)
{
    StaticString<64> s;
    EXPECT_STREQ(s, "");
    EXPECT_EQ(s.length(), 0);
}

TEST(KeelStaticString, ConstructionFromString)
{
    StaticString<64> s("hello");
    EXPECT_STREQ(s, "hello");
    EXPECT_EQ(s.length(), 5);
}

TEST(KeelStaticString, ConstructionFromTooLongString)
{
    StaticString<3> s("hello");
    EXPECT_STREQ(s, "he");
    EXPECT_EQ(s.length(), 2);
}

TEST(KeelStaticString, ConstructionFromTooLongStaticString)
{
    StaticString<64> other("hello");
    StaticString<3> s(other);
    EXPECT_STREQ(s, "he");
}

TEST(KeelStaticString, AppendOperator)
{
    StaticString<64> s("hello");
    s += " world";
    EXPECT_STREQ(s, "hello world");
}

TEST(KeelStaticString, AppendStaticString)
{
    StaticString<64> s("hello");
    StaticString<16> other(" there");
    s += other;
    EXPECT_STREQ(s, "hello there");
}

TEST(KeelStaticString, Clear)
{
    StaticString<64> s("hello");
    s.clear();
    EXPECT_STREQ(s, "");
    EXPECT_EQ(s.length(), 0);
}

TEST(KeelStaticString, AssignOperator)
{
    StaticString<64> s("hello");
    s = "goodbye";
    EXPECT_STREQ(s, "goodbye");
}

TEST(KeelStaticString, AssignOperatorTooLong)
{
    StaticString<5> s("hello");
    s = "goodbye";
    EXPECT_STREQ(s, "good");
}

TEST(KeelStaticString, Equality)
{
    StaticString<64> s("hello");
    EXPECT_TRUE(s == "hello");
    EXPECT_FALSE(s == "hell");
}

TEST(KeelStaticString, AppendDecimal)
{
    StaticString<64> s;
    s.append(1234);
    EXPECT_STREQ(s, "1234");
}

TEST(KeelStaticString, AppendHex)
{
    StaticString<64> s;
    s.append(0xbeef, 16);
    EXPECT_STREQ(s, "beef");
}

TEST(KeelStaticString, AppendZero)
{
    StaticString<64> s;
    s.append(static_cast<uint64_t>(0));
    EXPECT_STREQ(s, "0");
}

TEST(KeelStaticString, AppendLargestNumber)
{
    StaticString<64> s;
    s.append(~0ULL, 16);
    EXPECT_STREQ(s, "ffffffffffffffff");
}

TEST(KeelStaticString, NumberTruncatesFromTheRight)
{
    StaticString<4> s;
    s.append(123456);
    EXPECT_STREQ(s, "123");
}

TEST(KeelStaticString, PadIndents)
{
    StaticString<64> s;
    s.pad(4);
    s += "x";
    s.pad(2, '-');
    EXPECT_STREQ(s, "    x--");
}
