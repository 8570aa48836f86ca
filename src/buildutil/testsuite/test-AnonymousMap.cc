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

#include <memory/AnonymousMap.h>
#include <memory/AnonymousPage.h>
#include <memory/Entry.h>

#include "MemoryHarness.h"

class KeelAnonymousMap : public ::testing::Test
{
    protected:
        KeelAnonymousMap() : m_Harness(4096, 32, Environment::kernel())
        {
        }

        AnonymousPage *newPage()
        {
            physical_uintptr_t page = m_Harness.physicalMemory.allocatePage();
            return page ? AnonymousPage::create(m_Harness.caches, page) : 0;
        }

        size_t references(AnonymousMap *pMap)
        {
            ReadLockGuard<AnonymousMap> guard(*pMap);
            return pMap->getReferenceCount();
        }

        size_t references(AnonymousPage *pPage)
        {
            ReadLockGuard<AnonymousPage> guard(*pPage);
            return pPage->getReferenceCount();
        }

        void release(AnonymousMap *pMap)
        {
            WriteLockGuard<AnonymousMap> guard(*pMap);
            AnonymousMap::decrementReferenceCount(guard, m_Harness.caches);
        }

        MemoryHarness m_Harness;
};

TEST_F(KeelAnonymousMap, CreateIsEmpty)
{
    AnonymousMap *pMap = AnonymousMap::create(m_Harness.caches, 8, 4096);
    ASSERT_NE(pMap, (AnonymousMap *) 0);

    EXPECT_EQ(references(pMap), 1);
    EXPECT_EQ(pMap->getNumberOfPages(), 8);
    EXPECT_EQ(pMap->getPagesInUse(), 0);
    EXPECT_EQ(pMap->lookup(3), (AnonymousPage *) 0);

    release(pMap);
    EXPECT_EQ(m_Harness.caches.anonymousMaps.live(), 0);
}

TEST_F(KeelAnonymousMap, CreateFailsWhenPoolExhausted)
{
    m_Harness.caches.anonymousMaps.setLimit(1);

    AnonymousMap *pMap = AnonymousMap::create(m_Harness.caches, 1, 4096);
    ASSERT_NE(pMap, (AnonymousMap *) 0);
    EXPECT_EQ(AnonymousMap::create(m_Harness.caches, 1, 4096), (AnonymousMap *) 0);

    release(pMap);
}

TEST_F(KeelAnonymousMap, AddAndReplace)
{
    AnonymousMap *pMap = AnonymousMap::create(m_Harness.caches, 4, 4096);
    AnonymousPage *pFirst = newPage();
    AnonymousPage *pSecond = newPage();

    {
        WriteLockGuard<AnonymousMap> guard(*pMap);
        ASSERT_TRUE(pMap->add(guard, 2, pFirst, AnonymousMap::Add));
        EXPECT_EQ(pMap->lookup(2), pFirst);
        EXPECT_EQ(pMap->getPagesInUse(), 1);

        AnonymousPage *pOld = 0;
        ASSERT_TRUE(pMap->add(guard, 2, pSecond, AnonymousMap::Replace, &pOld));
        EXPECT_EQ(pOld, pFirst);
        EXPECT_EQ(pMap->lookup(2), pSecond);
        EXPECT_EQ(pMap->getPagesInUse(), 1);
    }

    WriteLockGuard<AnonymousPage> pageGuard(*pFirst);
    AnonymousPage::decrementReferenceCount(pageGuard, m_Harness.caches);

    release(pMap);
    EXPECT_EQ(m_Harness.physicalMemory.getAllocatedPageCount(), 0);
    EXPECT_EQ(m_Harness.caches.anonymousPages.live(), 0);
}

TEST_F(KeelAnonymousMap, AddFailsWithoutChunks)
{
    m_Harness.caches.anonymousPageChunks.setLimit(1);

    AnonymousMap *pMap = AnonymousMap::create(m_Harness.caches, 64, 4096);
    AnonymousPage *pFirst = newPage();
    AnonymousPage *pFar = newPage();

    WriteLockGuard<AnonymousMap> guard(*pMap);
    ASSERT_TRUE(pMap->add(guard, 0, pFirst, AnonymousMap::Add));
    EXPECT_FALSE(pMap->add(guard, 40, pFar, AnonymousMap::Add));
    EXPECT_EQ(pMap->getPagesInUse(), 1);
    guard.release();

    WriteLockGuard<AnonymousPage> pageGuard(*pFar);
    AnonymousPage::decrementReferenceCount(pageGuard, m_Harness.caches);

    release(pMap);
    EXPECT_EQ(m_Harness.physicalMemory.getAllocatedPageCount(), 0);
}

TEST_F(KeelAnonymousMap, ReleasePagesRange)
{
    AnonymousMap *pMap = AnonymousMap::create(m_Harness.caches, 40, 4096);

    WriteLockGuard<AnonymousMap> guard(*pMap);
    size_t indices[] = {0, 5, 17, 33};
    for (size_t i = 0; i < 4; ++i)
        ASSERT_TRUE(pMap->add(guard, indices[i], newPage(), AnonymousMap::Add));

    pMap->releasePages(guard, 4, 20, m_Harness.caches);
    EXPECT_EQ(pMap->getPagesInUse(), 2);
    EXPECT_NE(pMap->lookup(0), (AnonymousPage *) 0);
    EXPECT_EQ(pMap->lookup(5), (AnonymousPage *) 0);
    EXPECT_EQ(pMap->lookup(17), (AnonymousPage *) 0);
    EXPECT_NE(pMap->lookup(33), (AnonymousPage *) 0);
    EXPECT_EQ(m_Harness.physicalMemory.getAllocatedPageCount(), 2);

    AnonymousMap::decrementReferenceCount(guard, m_Harness.caches);
    EXPECT_EQ(m_Harness.physicalMemory.getAllocatedPageCount(), 0);
    EXPECT_EQ(m_Harness.caches.anonymousPageChunks.live(), 0);
}

TEST_F(KeelAnonymousMap, GrowOnlyExtends)
{
    AnonymousMap *pMap = AnonymousMap::create(m_Harness.caches, 4, 4096);
    {
        WriteLockGuard<AnonymousMap> guard(*pMap);
        pMap->grow(guard, 10);
        EXPECT_EQ(pMap->getNumberOfPages(), 10);
        pMap->grow(guard, 2);
        EXPECT_EQ(pMap->getNumberOfPages(), 10);
    }
    release(pMap);
}

TEST_F(KeelAnonymousMap, CopyCreatesMissingMap)
{
    Entry entry;
    entry.range = VirtualRange(HARNESS_BASE, 0x3000);
    entry.needsCopy = true;

    WriteLockGuard<AddressSpace> guard(m_Harness.addressSpace);
    ASSERT_TRUE(AnonymousMap::copy(guard, entry));

    EXPECT_FALSE(entry.needsCopy);
    ASSERT_NE(entry.anonymousMap.pMap, (AnonymousMap *) 0);
    EXPECT_EQ(entry.anonymousMap.pMap->getNumberOfPages(), 3);
    EXPECT_EQ(entry.anonymousMap.startOffset, 0);

    guard.release();
    entry.dropReferences(false, m_Harness.caches);
}

TEST_F(KeelAnonymousMap, CopyKeepsUnsharedMap)
{
    AnonymousMap *pMap = AnonymousMap::create(m_Harness.caches, 2, 4096);

    Entry entry;
    entry.range = VirtualRange(HARNESS_BASE, 0x2000);
    entry.anonymousMap.pMap = pMap;
    entry.needsCopy = true;

    WriteLockGuard<AddressSpace> guard(m_Harness.addressSpace);
    ASSERT_TRUE(AnonymousMap::copy(guard, entry));
    EXPECT_EQ(entry.anonymousMap.pMap, pMap);
    EXPECT_FALSE(entry.needsCopy);

    guard.release();
    entry.dropReferences(false, m_Harness.caches);
}

TEST_F(KeelAnonymousMap, CopySharesPagesOfSharedMap)
{
    AnonymousMap *pShared = AnonymousMap::create(m_Harness.caches, 8, 4096);
    AnonymousPage *pInside = newPage();
    AnonymousPage *pOutside = newPage();
    {
        WriteLockGuard<AnonymousMap> guard(*pShared);
        ASSERT_TRUE(pShared->add(guard, 3, pInside, AnonymousMap::Add));
        ASSERT_TRUE(pShared->add(guard, 6, pOutside, AnonymousMap::Add));

        // A second user of the map.
        AnonymousMap::incrementReferenceCount(guard);
    }

    // A window over pages [2, 5) of the shared map.
    Entry entry;
    entry.range = VirtualRange(HARNESS_BASE, 0x3000);
    entry.anonymousMap.pMap = pShared;
    entry.anonymousMap.startOffset = 0x2000;
    entry.needsCopy = true;

    WriteLockGuard<AddressSpace> guard(m_Harness.addressSpace);
    ASSERT_TRUE(AnonymousMap::copy(guard, entry));
    guard.release();

    AnonymousMap *pCopy = entry.anonymousMap.pMap;
    ASSERT_NE(pCopy, pShared);
    EXPECT_FALSE(entry.needsCopy);
    EXPECT_EQ(entry.anonymousMap.startOffset, 0);
    EXPECT_EQ(pCopy->getNumberOfPages(), 3);
    EXPECT_EQ(pCopy->getPagesInUse(), 1);
    EXPECT_EQ(pCopy->lookup(1), pInside);

    EXPECT_EQ(references(pInside), 2);
    EXPECT_EQ(references(pOutside), 1);
    EXPECT_EQ(references(pShared), 1);

    entry.dropReferences(false, m_Harness.caches);
    EXPECT_EQ(references(pInside), 1);

    release(pShared);
    EXPECT_EQ(m_Harness.physicalMemory.getAllocatedPageCount(), 0);
}

TEST_F(KeelAnonymousMap, CopyOfSharedMapFailsCleanly)
{
    AnonymousMap *pShared = AnonymousMap::create(m_Harness.caches, 2, 4096);
    {
        WriteLockGuard<AnonymousMap> guard(*pShared);
        AnonymousMap::incrementReferenceCount(guard);
    }
    m_Harness.caches.anonymousMaps.setLimit(1);

    Entry entry;
    entry.range = VirtualRange(HARNESS_BASE, 0x2000);
    entry.anonymousMap.pMap = pShared;
    entry.needsCopy = true;

    WriteLockGuard<AddressSpace> guard(m_Harness.addressSpace);
    EXPECT_FALSE(AnonymousMap::copy(guard, entry));
    guard.release();

    EXPECT_EQ(entry.anonymousMap.pMap, pShared);
    EXPECT_TRUE(entry.needsCopy);
    EXPECT_EQ(references(pShared), 2);

    release(pShared);
    release(pShared);
}

TEST_F(KeelAnonymousMap, CopyRollsBackWhenChunksRunOut)
{
    AnonymousMap *pShared = AnonymousMap::create(m_Harness.caches, 40, 4096);
    AnonymousPage *pLow = newPage();
    AnonymousPage *pHigh = newPage();
    {
        WriteLockGuard<AnonymousMap> guard(*pShared);
        ASSERT_TRUE(pShared->add(guard, 0, pLow, AnonymousMap::Add));
        ASSERT_TRUE(pShared->add(guard, 36, pHigh, AnonymousMap::Add));
        AnonymousMap::incrementReferenceCount(guard);
    }

    // The shared map holds two chunks; the copy can only get one more.
    m_Harness.caches.anonymousPageChunks.setLimit(3);

    Entry entry;
    entry.range = VirtualRange(HARNESS_BASE, 40 * 0x1000);
    entry.anonymousMap.pMap = pShared;
    entry.needsCopy = true;

    WriteLockGuard<AddressSpace> guard(m_Harness.addressSpace);
    EXPECT_FALSE(AnonymousMap::copy(guard, entry));
    guard.release();

    EXPECT_EQ(entry.anonymousMap.pMap, pShared);
    EXPECT_EQ(references(pLow), 1);
    EXPECT_EQ(references(pHigh), 1);
    EXPECT_EQ(m_Harness.caches.anonymousMaps.live(), 1);

    release(pShared);
    release(pShared);
    EXPECT_EQ(m_Harness.physicalMemory.getAllocatedPageCount(), 0);
}

TEST(KeelAnonymousMapDeathTest, AddToPopulatedSlot)
{
    MemoryHarness harness(4096, 4, Environment::kernel());

    AnonymousMap *pMap = AnonymousMap::create(harness.caches, 4, 4096);
    AnonymousPage *pPage = AnonymousPage::create(harness.caches, harness.physicalMemory.allocatePage());

    WriteLockGuard<AnonymousMap> guard(*pMap);
    ASSERT_TRUE(pMap->add(guard, 1, pPage, AnonymousMap::Add));
    EXPECT_DEATH(pMap->add(guard, 1, pPage, AnonymousMap::Add), "already populated");

    AnonymousMap::decrementReferenceCount(guard, harness.caches);
}
