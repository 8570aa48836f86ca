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

#include <utilities/ObjectPool.h>

TEST(KeelObjectPool, EmptyPoolAllocation)
{
    ObjectPool<int> x;

    int *a = x.allocate();
    int *b = x.allocate();

    EXPECT_NE(a, b);
    EXPECT_EQ(x.live(), 2);

    x.deallocate(a);
    x.deallocate(b);
    EXPECT_EQ(x.live(), 0);
}

TEST(KeelObjectPool, ObjectReuse)
{
    ObjectPool<int, 2> x;

    int *a1 = x.allocate();
    int *b1 = x.allocate();

    x.deallocate(a1);
    x.deallocate(b1);

    int *b2 = x.allocate();
    int *a2 = x.allocate();

    EXPECT_EQ(a1, a2);
    EXPECT_EQ(b1, b2);

    x.deallocate(a2);
    x.deallocate(b2);
}

TEST(KeelObjectPool, DeallocatedBeyondPoolSize)
{
    ObjectPool<int, 1> x;

    int *a1 = x.allocate();
    int *b1 = x.allocate();

    // Only a1 fits in the pool, b1 goes back to the heap.
    x.deallocate(a1);
    x.deallocate(b1);

    int *a2 = x.allocate();
    EXPECT_EQ(a1, a2);

    x.deallocate(a2);
}

TEST(KeelObjectPool, LimitReached)
{
    ObjectPool<int> x(2);

    int *a = x.allocate();
    int *b = x.allocate();
    ASSERT_NE(a, (int *) 0);
    ASSERT_NE(b, (int *) 0);

    EXPECT_EQ(x.allocate(), (int *) 0);

    x.deallocate(a);
    int *c = x.allocate();
    EXPECT_NE(c, (int *) 0);

    x.deallocate(b);
    x.deallocate(c);
}

TEST(KeelObjectPool, SetLimit)
{
    ObjectPool<int> x;

    int *a = x.allocate();
    x.setLimit(1);
    EXPECT_EQ(x.allocate(), (int *) 0);

    x.setLimit(0);
    int *b = x.allocate();
    EXPECT_NE(b, (int *) 0);

    x.deallocate(a);
    x.deallocate(b);
}

TEST(KeelObjectPool, AllocateMany)
{
    ObjectPool<int> x(3);

    int *objects[3] = {0, 0, 0};
    EXPECT_TRUE(x.allocateMany(objects, 3));
    EXPECT_NE(objects[0], objects[1]);
    EXPECT_NE(objects[1], objects[2]);
    EXPECT_EQ(x.live(), 3);

    for (size_t i = 0; i < 3; ++i)
        x.deallocate(objects[i]);
}

TEST(KeelObjectPool, AllocateManyIsAllOrNothing)
{
    ObjectPool<int> x(3);

    int *a = x.allocate();

    int *objects[3] = {0, 0, 0};
    EXPECT_FALSE(x.allocateMany(objects, 3));
    EXPECT_EQ(objects[0], (int *) 0);
    EXPECT_EQ(x.live(), 1);

    x.deallocate(a);
}
