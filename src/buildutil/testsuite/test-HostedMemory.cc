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

#include <string.h>

#include <gtest/gtest.h>

#include <core/processor/hosted/PhysicalMemoryManager.h>
#include <core/processor/hosted/PageTable.h>

TEST(KeelHostedPhysicalMemoryManager, AllocatesDistinctPages)
{
    HostedPhysicalMemoryManager pmm(4096, 4);

    physical_uintptr_t a = pmm.allocatePage();
    physical_uintptr_t b = pmm.allocatePage();

    EXPECT_NE(a, 0);
    EXPECT_NE(b, 0);
    EXPECT_NE(a, b);
    EXPECT_EQ(a & 4095, 0);
    EXPECT_EQ(pmm.getAllocatedPageCount(), 2);
    EXPECT_EQ(pmm.getFreePageCount(), 2);

    pmm.freePage(a);
    pmm.freePage(b);
    EXPECT_EQ(pmm.getAllocatedPageCount(), 0);
}

TEST(KeelHostedPhysicalMemoryManager, ExhaustionReturnsZero)
{
    HostedPhysicalMemoryManager pmm(4096, 1);

    physical_uintptr_t a = pmm.allocatePage();
    EXPECT_NE(a, 0);
    EXPECT_EQ(pmm.allocatePage(), 0);

    pmm.freePage(a);
    EXPECT_EQ(pmm.allocatePage(), a);
    pmm.freePage(a);
}

TEST(KeelHostedPhysicalMemoryManager, PagesAreBackedByMemory)
{
    HostedPhysicalMemoryManager pmm(4096, 2);

    physical_uintptr_t a = pmm.allocatePage();
    physical_uintptr_t b = pmm.allocatePage();

    uint8_t *pA = reinterpret_cast<uint8_t *>(pmm.mapPhysical(a));
    uint8_t *pB = reinterpret_cast<uint8_t *>(pmm.mapPhysical(b));
    EXPECT_NE(pA, pB);

    memset(pA, 0xAB, 4096);
    memset(pB, 0xCD, 4096);
    EXPECT_EQ(pA[4095], 0xAB);
    EXPECT_EQ(pB[0], 0xCD);

    pmm.freePage(a);
    pmm.freePage(b);
}

TEST(KeelHostedPhysicalMemoryManagerDeathTest, DoubleFree)
{
    HostedPhysicalMemoryManager pmm(4096, 2);
    physical_uintptr_t a = pmm.allocatePage();
    pmm.freePage(a);

    EXPECT_DEATH(pmm.freePage(a), "DOUBLE FREE");
}

TEST(KeelHostedPhysicalMemoryManagerDeathTest, ForeignPage)
{
    HostedPhysicalMemoryManager pmm(4096, 2);
    EXPECT_DEATH(pmm.freePage(0x1000), "bad physical page");
}

TEST(KeelHostedPageTable, MapAndLookup)
{
    HostedPageTable table(4096);

    EXPECT_TRUE(table.map(0x10000, 0x200000,
                          MapType(Environment::kernel(), ReadWrite, Uncached)));

    HostedPageTable::Mapping mapping;
    ASSERT_TRUE(table.getMapping(0x10000, mapping));
    EXPECT_EQ(mapping.physical, 0x200000);
    EXPECT_EQ(mapping.protection, ReadWrite);
    EXPECT_EQ(mapping.cacheType, Uncached);
    EXPECT_EQ(mapping.environment, Environment::Kernel);

    // Any address inside the page resolves to it.
    EXPECT_TRUE(table.getMapping(0x10FFF, mapping));
    EXPECT_FALSE(table.getMapping(0x11000, mapping));
}

TEST(KeelHostedPageTable, MapReplaces)
{
    HostedPageTable table(4096);

    table.map(0x10000, 0x200000, MapType(Environment::kernel(), Read));
    table.map(0x10000, 0x300000, MapType(Environment::kernel(), ReadWrite));

    HostedPageTable::Mapping mapping;
    ASSERT_TRUE(table.getMapping(0x10000, mapping));
    EXPECT_EQ(mapping.physical, 0x300000);
    EXPECT_EQ(mapping.protection, ReadWrite);
    EXPECT_EQ(table.count(), 1);
}

TEST(KeelHostedPageTable, LimitReached)
{
    HostedPageTable table(4096, 1);

    EXPECT_TRUE(table.map(0x10000, 0x200000, MapType(Environment::kernel(), Read)));
    EXPECT_FALSE(table.map(0x11000, 0x201000, MapType(Environment::kernel(), Read)));

    // Replacing an existing translation needs no new slot.
    EXPECT_TRUE(table.map(0x10000, 0x202000, MapType(Environment::kernel(), Read)));
}

TEST(KeelHostedPageTable, UnmapRange)
{
    HostedPageTable table(4096);

    for (uintptr_t va = 0x10000; va < 0x14000; va += 0x1000)
        table.map(va, 0x200000 + va, MapType(Environment::kernel(), Read));

    table.unmap(VirtualRange(0x11000, 0x2000));

    HostedPageTable::Mapping mapping;
    EXPECT_TRUE(table.getMapping(0x10000, mapping));
    EXPECT_FALSE(table.getMapping(0x11000, mapping));
    EXPECT_FALSE(table.getMapping(0x12000, mapping));
    EXPECT_TRUE(table.getMapping(0x13000, mapping));
    EXPECT_EQ(table.count(), 2);
}

TEST(KeelHostedPageTable, ChangeProtectionRange)
{
    HostedPageTable table(4096);

    table.map(0x10000, 0x200000, MapType(Environment::kernel(), ReadWrite));
    table.map(0x11000, 0x201000, MapType(Environment::kernel(), ReadWrite));

    table.changeProtection(VirtualRange(0x11000, 0x4000), MapType(Environment::kernel(), Read));

    HostedPageTable::Mapping mapping;
    ASSERT_TRUE(table.getMapping(0x10000, mapping));
    EXPECT_EQ(mapping.protection, ReadWrite);
    ASSERT_TRUE(table.getMapping(0x11000, mapping));
    EXPECT_EQ(mapping.protection, Read);

    // Unmapped pages in the range stay unmapped.
    EXPECT_FALSE(table.getMapping(0x12000, mapping));
}
