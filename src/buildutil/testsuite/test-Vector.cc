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

#include <utilities/Vector.h>

TEST(KeelVector, StartsEmpty)
{
    Vector<int> x;
    EXPECT_EQ(x.capacity(), 0);
    EXPECT_EQ(x.count(), 0);
    EXPECT_EQ(x.begin(), x.end());
}

TEST(KeelVector, ReservingConstructor)
{
    Vector<int> x(5);
    EXPECT_EQ(x.capacity(), 5);
    EXPECT_EQ(x.count(), 0);
}

TEST(KeelVector, CopiesAreIndependent)
{
    Vector<int> x;
    x.pushBack(5);
    Vector<int> y(x);
    y.pushBack(6);
    x[0] = 7;

    EXPECT_EQ(x.count(), 1);
    ASSERT_EQ(y.count(), 2);
    EXPECT_EQ(y[0], 5);
    EXPECT_EQ(y[1], 6);
}

TEST(KeelVector, AssignmentReplacesContents)
{
    Vector<int> x, y;
    x.pushBack(5);
    x.pushBack(6);
    y.pushBack(1);
    y.pushBack(2);
    y.pushBack(3);
    y = x;
    ASSERT_EQ(y.count(), 2);
    EXPECT_EQ(y[0], 5);
    EXPECT_EQ(y[1], 6);
}

TEST(KeelVector, OutOfRangeReadsDefault)
{
    Vector<uintptr_t> x;
    x.pushBack(1);
    EXPECT_EQ(x[5], 0);
    x[5] = 9;
    EXPECT_EQ(x[6], 0);
}

TEST(KeelVector, ReserveKeepsContents)
{
    Vector<int> x;
    x.pushBack(1);
    x.pushBack(2);
    x.reserve(64);
    EXPECT_GE(x.capacity(), 64);
    ASSERT_EQ(x.count(), 2);
    EXPECT_EQ(x[1], 2);
}

/** The way address spaces keep their entries: insert at the sorted position. */
TEST(KeelVector, SortedInsertion)
{
    Vector<uintptr_t> x;
    const uintptr_t addresses[] = {0x5000, 0x1000, 0x9000, 0x3000, 0x7000};
    for (size_t i = 0; i < sizeof addresses / sizeof addresses[0]; ++i)
    {
        size_t at = 0;
        while (at < x.count() && x[at] < addresses[i])
            ++at;
        x.insert(at, addresses[i]);
    }

    ASSERT_EQ(x.count(), 5);
    for (size_t i = 0; i < x.count(); ++i)
        EXPECT_EQ(x[i], 0x1000 + i * 0x2000);
}

TEST(KeelVector, InsertPastEndAppends)
{
    Vector<int> x;
    x.pushBack(1);
    x.insert(10, 2);
    ASSERT_EQ(x.count(), 2);
    EXPECT_EQ(x[1], 2);
}

TEST(KeelVector, InsertManyGrows)
{
    Vector<int> x;
    for (int i = 0; i < 100; ++i)
        x.insert(0, i);

    ASSERT_EQ(x.count(), 100);
    for (int i = 0; i < 100; ++i)
        EXPECT_EQ(x[i], 99 - i);
}

TEST(KeelVector, RemoveClosesGap)
{
    Vector<int> x;
    x.pushBack(1);
    x.pushBack(2);
    x.pushBack(3);
    EXPECT_EQ(x.remove(1), 2);
    ASSERT_EQ(x.count(), 2);
    EXPECT_EQ(x[0], 1);
    EXPECT_EQ(x[1], 3);

    EXPECT_EQ(x.remove(1), 3);
    EXPECT_EQ(x.remove(0), 1);
    EXPECT_EQ(x.count(), 0);
}

TEST(KeelVector, EraseFirst)
{
    Vector<int> x;
    x.pushBack(1);
    x.pushBack(2);
    x.erase(x.begin());
    ASSERT_EQ(x.count(), 1);
    EXPECT_EQ(x[0], 2);
}

TEST(KeelVector, ClearReleasesStorage)
{
    Vector<int> x;
    x.pushBack(1);
    x.clear();
    EXPECT_EQ(x.count(), 0);
    EXPECT_EQ(x.capacity(), 0);
    x.pushBack(4);
    EXPECT_EQ(x[0], 4);
}

TEST(KeelVector, ConstIteration)
{
    Vector<int> x;
    for (int i = 1; i <= 3; ++i)
        x.pushBack(i);

    const Vector<int> &y = x;
    int expected = 1;
    for (Vector<int>::ConstIterator it = y.begin(); it != y.end(); ++it)
        EXPECT_EQ(*it, expected++);
    EXPECT_EQ(expected, 4);
}

TEST(KeelVector, PopBackIsLastIn)
{
    Vector<int> x;
    x.pushBack(1);
    x.pushBack(2);
    EXPECT_EQ(x.popBack(), 2);
    EXPECT_EQ(x.popBack(), 1);
    EXPECT_EQ(x.count(), 0);
}
