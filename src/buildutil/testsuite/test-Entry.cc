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

#include <core/processor/hosted/PhysicalMemoryManager.h>
#include <memory/AddressSpaceCaches.h>
#include <memory/AnonymousMap.h>
#include <memory/AnonymousPage.h>
#include <memory/Entry.h>
#include <memory/MemoryObject.h>

class KeelEntry : public ::testing::Test
{
    protected:
        KeelEntry() : m_PhysicalMemory(4096, 16), m_Caches(m_PhysicalMemory)
        {
        }

        Entry zeroFill(uintptr_t address, size_t size, Protection protection)
        {
            Entry entry;
            entry.range = VirtualRange(address, size);
            entry.protection = protection;
            entry.maxProtection = protection;
            entry.copyOnWrite = true;
            entry.needsCopy = true;
            return entry;
        }

        /** Gives entry a private map with a page at each of the first count
         *  slots. */
        void populate(Entry &entry, size_t count)
        {
            AnonymousMap *pMap = AnonymousMap::create(m_Caches, entry.range.size / 4096, 4096);
            ASSERT_NE(pMap, (AnonymousMap *) 0);

            WriteLockGuard<AnonymousMap> guard(*pMap);
            for (size_t i = 0; i < count; ++i)
            {
                AnonymousPage *pPage = AnonymousPage::create(m_Caches, m_PhysicalMemory.allocatePage());
                ASSERT_TRUE(pMap->add(guard, i, pPage, AnonymousMap::Add));
            }

            entry.anonymousMap.pMap = pMap;
            entry.anonymousMap.startOffset = 0;
            entry.needsCopy = false;
        }

        size_t objectReferences(MemoryObject *pObject)
        {
            ReadLockGuard<MemoryObject> guard(*pObject);
            return pObject->getReferenceCount();
        }

        void takeObjectReference(MemoryObject *pObject)
        {
            WriteLockGuard<MemoryObject> guard(*pObject);
            MemoryObject::incrementReferenceCount(guard);
        }

        void dropObjectReference(MemoryObject *pObject)
        {
            WriteLockGuard<MemoryObject> guard(*pObject);
            MemoryObject::decrementReferenceCount(guard);
        }

        HostedPhysicalMemoryManager m_PhysicalMemory;
        AddressSpaceCaches m_Caches;
};

TEST_F(KeelEntry, AdjacentZeroFillMerges)
{
    Entry a = zeroFill(0x10000, 0x2000, ReadWrite);
    Entry b = zeroFill(0x12000, 0x1000, ReadWrite);

    ASSERT_TRUE(a.canMerge(b));
    a.merge(b, m_Caches);

    EXPECT_EQ(a.range, VirtualRange(0x10000, 0x3000));
    EXPECT_TRUE(a.needsCopy);
}

TEST_F(KeelEntry, MergeNeedsMatchingAttributes)
{
    Entry a = zeroFill(0x10000, 0x1000, ReadWrite);

    Entry differentProtection = zeroFill(0x11000, 0x1000, Read);
    EXPECT_FALSE(a.canMerge(differentProtection));

    Entry differentMax = zeroFill(0x11000, 0x1000, ReadWrite);
    differentMax.maxProtection = Execute;
    EXPECT_FALSE(a.canMerge(differentMax));

    Entry gap = zeroFill(0x12000, 0x1000, ReadWrite);
    EXPECT_FALSE(a.canMerge(gap));

    Entry wired = zeroFill(0x11000, 0x1000, ReadWrite);
    wired.wiredCount = 1;
    EXPECT_FALSE(a.canMerge(wired));
}

TEST_F(KeelEntry, ObjectWindowsMustBeContiguous)
{
    MemoryObject *pObject = new MemoryObject("file", m_PhysicalMemory);

    Entry a = zeroFill(0x10000, 0x1000, Read);
    a.object.pObject = pObject;
    a.object.startOffset = 0x3000;
    takeObjectReference(pObject);

    Entry b = zeroFill(0x11000, 0x1000, Read);
    b.object.pObject = pObject;
    b.object.startOffset = 0x5000;
    takeObjectReference(pObject);

    EXPECT_FALSE(a.canMerge(b));

    b.object.startOffset = 0x4000;
    ASSERT_TRUE(a.canMerge(b));

    EXPECT_EQ(objectReferences(pObject), 3);
    a.merge(b, m_Caches);
    EXPECT_EQ(objectReferences(pObject), 2);
    EXPECT_EQ(b.object.pObject, (MemoryObject *) 0);

    a.dropReferences(true, m_Caches);
    EXPECT_EQ(objectReferences(pObject), 1);
    dropObjectReference(pObject);
}

TEST_F(KeelEntry, ZeroFillDoesNotMergeWithObject)
{
    MemoryObject *pObject = new MemoryObject("file", m_PhysicalMemory);

    Entry a = zeroFill(0x10000, 0x1000, Read);
    Entry b = zeroFill(0x11000, 0x1000, Read);
    b.object.pObject = pObject;

    EXPECT_FALSE(a.canMerge(b));
    EXPECT_FALSE(b.canMerge(a));

    dropObjectReference(pObject);
}

TEST_F(KeelEntry, PrivateMapAbsorbsFollowingZeroFill)
{
    Entry a = zeroFill(0x10000, 0x2000, ReadWrite);
    populate(a, 1);
    Entry b = zeroFill(0x12000, 0x2000, ReadWrite);

    ASSERT_TRUE(a.canMerge(b));
    a.merge(b, m_Caches);

    EXPECT_EQ(a.range.size, 0x4000);
    EXPECT_EQ(a.anonymousMap.pMap->getNumberOfPages(), 4);
    EXPECT_EQ(a.anonymousMap.pMap->getPagesInUse(), 1);

    a.dropReferences(true, m_Caches);
    EXPECT_EQ(m_PhysicalMemory.getAllocatedPageCount(), 0);
}

TEST_F(KeelEntry, SplitSharesBackingStores)
{
    MemoryObject *pObject = new MemoryObject("file", m_PhysicalMemory);

    Entry lower = zeroFill(0x10000, 0x4000, ReadWrite);
    populate(lower, 4);
    lower.object.pObject = pObject;
    lower.object.startOffset = 0x1000;
    takeObjectReference(pObject);

    Entry upper;
    lower.split(upper, 0x1000);

    EXPECT_EQ(lower.range, VirtualRange(0x10000, 0x1000));
    EXPECT_EQ(upper.range, VirtualRange(0x11000, 0x3000));
    EXPECT_EQ(upper.anonymousMap.pMap, lower.anonymousMap.pMap);
    EXPECT_EQ(upper.anonymousMap.startOffset, 0x1000);
    EXPECT_EQ(upper.object.startOffset, 0x2000);
    EXPECT_EQ(upper.protection, ReadWrite);
    EXPECT_EQ(objectReferences(pObject), 3);
    {
        ReadLockGuard<AnonymousMap> guard(*lower.anonymousMap.pMap);
        EXPECT_EQ(lower.anonymousMap.pMap->getReferenceCount(), 2);
    }

    upper.dropReferences(true, m_Caches);
    lower.dropReferences(true, m_Caches);
    dropObjectReference(pObject);
    EXPECT_EQ(m_PhysicalMemory.getAllocatedPageCount(), 0);
}

TEST_F(KeelEntry, ShrinkFromEndFreesTrimmedPages)
{
    Entry entry = zeroFill(0x10000, 0x4000, ReadWrite);
    populate(entry, 4);

    entry.shrink(Entry::FromEnd, 0x1000, true, m_Caches);

    EXPECT_EQ(entry.range, VirtualRange(0x10000, 0x1000));
    EXPECT_EQ(entry.anonymousMap.pMap->getPagesInUse(), 1);
    EXPECT_EQ(m_PhysicalMemory.getAllocatedPageCount(), 1);

    entry.dropReferences(true, m_Caches);
}

TEST_F(KeelEntry, ShrinkFromStartMovesWindow)
{
    Entry entry = zeroFill(0x10000, 0x4000, ReadWrite);
    populate(entry, 4);

    entry.shrink(Entry::FromStart, 0x1000, true, m_Caches);

    EXPECT_EQ(entry.range, VirtualRange(0x13000, 0x1000));
    EXPECT_EQ(entry.anonymousMap.startOffset, 0x3000);
    EXPECT_NE(entry.anonymousMap.pMap->lookup(3), (AnonymousPage *) 0);
    EXPECT_EQ(entry.anonymousMap.pMap->lookup(0), (AnonymousPage *) 0);

    entry.dropReferences(true, m_Caches);
    EXPECT_EQ(m_PhysicalMemory.getAllocatedPageCount(), 0);
}

TEST_F(KeelEntry, ShrinkKeepsPagesWhenAsked)
{
    Entry entry = zeroFill(0x10000, 0x4000, ReadWrite);
    populate(entry, 4);

    entry.shrink(Entry::FromEnd, 0x2000, false, m_Caches);
    EXPECT_EQ(entry.anonymousMap.pMap->getPagesInUse(), 4);

    // The last reference to the map still frees everything.
    entry.dropReferences(false, m_Caches);
    EXPECT_EQ(m_PhysicalMemory.getAllocatedPageCount(), 0);
}

TEST_F(KeelEntry, CreateManyIsAllOrNothing)
{
    m_Caches.entries.setLimit(1);

    Entry *pEntries[2] = {0, 0};
    EXPECT_FALSE(Entry::createMany(m_Caches, pEntries, 2));
    EXPECT_EQ(m_Caches.entries.live(), 0);

    m_Caches.entries.setLimit(0);
    ASSERT_TRUE(Entry::createMany(m_Caches, pEntries, 2));
    EXPECT_EQ(pEntries[0]->protection, None);
    EXPECT_EQ(pEntries[1]->anonymousMap.pMap, (AnonymousMap *) 0);

    Entry::destroy(m_Caches, pEntries[0]);
    Entry::destroy(m_Caches, pEntries[1]);
}

TEST_F(KeelEntry, PooledEntriesComeBackReset)
{
    Entry *pEntry = Entry::create(m_Caches);
    pEntry->protection = ReadWrite;
    pEntry->wiredCount = 3;
    Entry::destroy(m_Caches, pEntry);

    Entry *pAgain = Entry::create(m_Caches);
    EXPECT_EQ(pAgain->protection, None);
    EXPECT_EQ(pAgain->wiredCount, 0);
    Entry::destroy(m_Caches, pAgain);
}

TEST(KeelEntryDeathTest, SplitAtBoundary)
{
    Entry entry;
    entry.range = VirtualRange(0x10000, 0x2000);

    Entry upper;
    EXPECT_DEATH(entry.split(upper, 0), "Entry::split");
    EXPECT_DEATH(entry.split(upper, 0x2000), "Entry::split");
}

TEST(KeelEntryDeathTest, ShrinkToNothing)
{
    HostedPhysicalMemoryManager physicalMemory(4096, 1);
    AddressSpaceCaches caches(physicalMemory);

    Entry entry;
    entry.range = VirtualRange(0x10000, 0x2000);
    EXPECT_DEATH(entry.shrink(Entry::FromEnd, 0, true, caches), "Entry::shrink");
}
