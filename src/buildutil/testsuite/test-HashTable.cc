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

#include <set>

#include <gtest/gtest.h>

#include <utilities/HashTable.h>

/** Keys by page number, hashing to the page number itself. */
struct PageNumber
{
    PageNumber() : page(~0UL)
    {
    }

    PageNumber(uintptr_t p) : page(p)
    {
    }

    size_t hash() const
    {
        return page;
    }

    bool operator == (const PageNumber &other) const
    {
        return page == other.page;
    }

    uintptr_t page;
};

/** Every key lands in the same chain. */
struct SameBucket : public PageNumber
{
    SameBucket()
    {
    }

    SameBucket(uintptr_t p) : PageNumber(p)
    {
    }

    size_t hash() const
    {
        return 7;
    }
};

TEST(KeelHashTable, EmptyLookupAndRemove)
{
    HashTable<PageNumber, int> table;
    EXPECT_EQ(table.lookup(PageNumber(3)), (int *) 0);
    EXPECT_EQ(table.remove(PageNumber(3)), (int *) 0);
    EXPECT_EQ(table.count(), 0);
    EXPECT_FALSE(table.begin() != table.end());
}

TEST(KeelHashTable, InsertLookupRemove)
{
    HashTable<PageNumber, int> table(5);
    int value = 1;

    EXPECT_TRUE(table.insert(PageNumber(0x42), &value));
    EXPECT_EQ(table.lookup(PageNumber(0x42)), &value);
    EXPECT_EQ(table.count(), 1);

    EXPECT_EQ(table.remove(PageNumber(0x42)), &value);
    EXPECT_EQ(table.lookup(PageNumber(0x42)), (int *) 0);
    EXPECT_EQ(table.count(), 0);
}

TEST(KeelHashTable, DuplicateKeyRejected)
{
    HashTable<PageNumber, int> table;
    int first = 1, second = 2;

    EXPECT_TRUE(table.insert(PageNumber(9), &first));
    EXPECT_FALSE(table.insert(PageNumber(9), &second));
    EXPECT_EQ(table.lookup(PageNumber(9)), &first);
    EXPECT_EQ(table.count(), 1);
}

TEST(KeelHashTable, KeysSharingABucket)
{
    HashTable<PageNumber, int> table(4);
    int values[3];

    // 1, 5 and 9 all reduce to bucket 1.
    for (int i = 0; i < 3; ++i)
        ASSERT_TRUE(table.insert(PageNumber(1 + i * 4), &values[i]));

    EXPECT_EQ(table.remove(PageNumber(5)), &values[1]);
    EXPECT_EQ(table.lookup(PageNumber(1)), &values[0]);
    EXPECT_EQ(table.lookup(PageNumber(9)), &values[2]);
    EXPECT_EQ(table.count(), 2);
}

TEST(KeelHashTable, FullCollisionChain)
{
    HashTable<SameBucket, int> table(16);
    int values[8];

    for (int i = 0; i < 8; ++i)
        ASSERT_TRUE(table.insert(SameBucket(i), &values[i]));

    // Remove from the head, the middle and the tail of the chain.
    EXPECT_EQ(table.remove(SameBucket(7)), &values[7]);
    EXPECT_EQ(table.remove(SameBucket(3)), &values[3]);
    EXPECT_EQ(table.remove(SameBucket(0)), &values[0]);

    for (int i = 0; i < 8; ++i)
    {
        if (i == 0 || i == 3 || i == 7)
            EXPECT_EQ(table.lookup(SameBucket(i)), (int *) 0);
        else
            EXPECT_EQ(table.lookup(SameBucket(i)), &values[i]);
    }
}

TEST(KeelHashTable, IterationVisitsEveryKey)
{
    HashTable<PageNumber, int> table(8);
    int values[20];

    for (uintptr_t i = 0; i < 20; ++i)
        ASSERT_TRUE(table.insert(PageNumber(i * 3), &values[i]));

    std::set<uintptr_t> seen;
    for (HashTable<PageNumber, int>::Iterator it = table.begin(); it != table.end(); ++it)
    {
        EXPECT_EQ(*it, &values[it.key().page / 3]);
        seen.insert(it.key().page);
    }
    EXPECT_EQ(seen.size(), 20);
}

TEST(KeelHashTable, ClearLeavesValuesAlone)
{
    HashTable<PageNumber, int> table;
    int value = 5;

    table.insert(PageNumber(1), &value);
    table.insert(PageNumber(2), &value);
    table.clear();

    EXPECT_EQ(table.count(), 0);
    EXPECT_EQ(table.lookup(PageNumber(1)), (int *) 0);
    EXPECT_EQ(value, 5);

    EXPECT_TRUE(table.insert(PageNumber(1), &value));
}

TEST(KeelHashTable, ZeroBucketsMeansOne)
{
    HashTable<PageNumber, int> table(0);
    int a = 0, b = 0;
    EXPECT_TRUE(table.insert(PageNumber(100), &a));
    EXPECT_TRUE(table.insert(PageNumber(200), &b));
    EXPECT_EQ(table.lookup(PageNumber(200)), &b);
}
