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

#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include <memory/AnonymousMap.h>
#include <memory/AnonymousPage.h>
#include <memory/FaultInfo.h>
#include <memory/MemoryObject.h>

#include "MemoryHarness.h"

#define PAGE 0x1000

class KeelPageFault : public ::testing::Test
{
    protected:
        KeelPageFault() : m_Harness(PAGE, 16, Environment::kernel()), m_pObject(0)
        {
        }

        virtual void TearDown()
        {
            if (m_pObject)
            {
                WriteLockGuard<MemoryObject> guard(*m_pObject);
                MemoryObject::decrementReferenceCount(guard);
            }
        }

        VirtualRange mapAnonymous(size_t size, Protection protection)
        {
            VirtualRange result;
            EXPECT_EQ(m_Harness.mapAnonymous(0, size, protection, result), MapError::None);
            return result;
        }

        /** Creates an object with pages resident at [0, count), each filled
         *  with its index plus one. */
        void createObject(size_t count)
        {
            m_pObject = new MemoryObject("file", m_Harness.physicalMemory);
            for (size_t i = 0; i < count; ++i)
            {
                physical_uintptr_t page = m_Harness.physicalMemory.allocatePage();
                memset(m_Harness.physicalMemory.mapPhysical(page), static_cast<int>(i + 1), PAGE);
                ASSERT_TRUE(m_pObject->insertPage(i, page));
            }
        }

        VirtualRange mapObject(size_t size, size_t offset, Protection protection)
        {
            AddressSpace::MapOptions options;
            options.size = size;
            options.protection = protection;
            options.pObject = m_pObject;
            options.objectOffset = offset;

            VirtualRange result;
            EXPECT_EQ(m_Harness.addressSpace.map(options, result), MapError::None);
            return result;
        }

        PageFaultError::Type fault(uintptr_t address, AddressSpace::AccessType access)
        {
            return m_Harness.addressSpace.handlePageFault(address, access);
        }

        physical_uintptr_t physical(uintptr_t address)
        {
            HostedPageTable::Mapping mapping;
            if (!m_Harness.pageTable.getMapping(address, mapping))
                return 0;
            return mapping.physical;
        }

        Protection protection(uintptr_t address)
        {
            Protection result = None;
            m_Harness.translated(address, result);
            return result;
        }

        /** Applies changes to the entry at index under the entries lock,
         *  standing in for operations that share maps between entries. */
        template <class F>
        void editEntry(size_t index, F edit)
        {
            WriteLockGuard<AddressSpace> guard(m_Harness.addressSpace);
            edit(const_cast<Entry &>(m_Harness.addressSpace.getEntry(index)));
        }

        MemoryHarness m_Harness;
        MemoryObject *m_pObject;
};

TEST_F(KeelPageFault, WriteFaultZeroFills)
{
    VirtualRange range = mapAnonymous(4 * PAGE, ReadWrite);
    uintptr_t address = range.address + 2 * PAGE + 0x10;

    ASSERT_EQ(fault(address, AddressSpace::WriteAccess), PageFaultError::None);

    Entry entry = m_Harness.entry(0);
    EXPECT_FALSE(entry.needsCopy);
    ASSERT_NE(entry.anonymousMap.pMap, (AnonymousMap *) 0);
    EXPECT_EQ(entry.anonymousMap.pMap->getPagesInUse(), 1);
    EXPECT_NE(entry.anonymousMap.pMap->lookup(2), (AnonymousPage *) 0);

    EXPECT_EQ(protection(address), ReadWrite);
    uint8_t *pContents = m_Harness.contents(address);
    ASSERT_NE(pContents, (uint8_t *) 0);
    for (size_t i = 0; i < PAGE; ++i)
        ASSERT_EQ(pContents[i], 0);

    EXPECT_EQ(m_Harness.physicalMemory.getAllocatedPageCount(), 1);
}

TEST_F(KeelPageFault, ReadFaultZeroFills)
{
    VirtualRange range = mapAnonymous(2 * PAGE, ReadWrite);

    ASSERT_EQ(fault(range.address, AddressSpace::ReadAccess), PageFaultError::None);

    EXPECT_FALSE(m_Harness.entry(0).needsCopy);
    EXPECT_NE(physical(range.address), 0);
    EXPECT_EQ(m_Harness.contents(range.address)[PAGE - 1], 0);
}

TEST_F(KeelPageFault, ExecuteFaultOnExecutableEntry)
{
    VirtualRange range = mapAnonymous(PAGE, Execute);

    ASSERT_EQ(fault(range.address, AddressSpace::ExecuteAccess), PageFaultError::None);
    EXPECT_EQ(protection(range.address), Execute);
}

TEST_F(KeelPageFault, RepeatedFaultReusesPage)
{
    VirtualRange range = mapAnonymous(PAGE, ReadWrite);

    ASSERT_EQ(fault(range.address, AddressSpace::WriteAccess), PageFaultError::None);
    physical_uintptr_t first = physical(range.address);
    m_Harness.contents(range.address)[7] = 0x42;

    m_Harness.pageTable.unmap(range);
    ASSERT_EQ(fault(range.address + 0x123, AddressSpace::ReadAccess), PageFaultError::None);
    EXPECT_EQ(physical(range.address), first);
    EXPECT_EQ(m_Harness.contents(range.address)[7], 0x42);
    EXPECT_EQ(m_Harness.physicalMemory.getAllocatedPageCount(), 1);
}

TEST_F(KeelPageFault, UnmappedAddress)
{
    VirtualRange range = mapAnonymous(PAGE, ReadWrite);

    EXPECT_EQ(fault(range.endBound(), AddressSpace::ReadAccess), PageFaultError::NotMapped);
    EXPECT_EQ(fault(0x1000, AddressSpace::WriteAccess), PageFaultError::NotMapped);
}

TEST_F(KeelPageFault, AccessBeyondProtection)
{
    VirtualRange readOnly = mapAnonymous(PAGE, Read);
    VirtualRange executable = mapAnonymous(PAGE, Execute);
    VirtualRange inaccessible = mapAnonymous(PAGE, None);

    EXPECT_EQ(fault(readOnly.address, AddressSpace::WriteAccess), PageFaultError::Protection);
    EXPECT_EQ(fault(readOnly.address, AddressSpace::ExecuteAccess), PageFaultError::Protection);
    EXPECT_EQ(fault(executable.address, AddressSpace::WriteAccess), PageFaultError::Protection);
    EXPECT_EQ(fault(inaccessible.address, AddressSpace::ReadAccess), PageFaultError::Protection);

    EXPECT_EQ(m_Harness.pageTable.count(), 0);
    EXPECT_EQ(m_Harness.physicalMemory.getAllocatedPageCount(), 0);
}

TEST(KeelPageFaultExhaustion, PhysicalMemory)
{
    MemoryHarness harness(PAGE, 1, Environment::kernel());

    VirtualRange range;
    ASSERT_EQ(harness.mapAnonymous(0, 2 * PAGE, ReadWrite, range), MapError::None);

    EXPECT_EQ(harness.addressSpace.handlePageFault(range.address, AddressSpace::WriteAccess),
              PageFaultError::None);
    EXPECT_EQ(harness.addressSpace.handlePageFault(range.address + PAGE, AddressSpace::WriteAccess),
              PageFaultError::OutOfMemory);
    EXPECT_EQ(harness.entry(0).anonymousMap.pMap->getPagesInUse(), 1);
    EXPECT_EQ(harness.caches.anonymousPages.live(), 1);
}

TEST_F(KeelPageFault, PageTableFull)
{
    VirtualRange range = mapAnonymous(2 * PAGE, ReadWrite);
    m_Harness.pageTable.setLimit(1);

    EXPECT_EQ(fault(range.address, AddressSpace::WriteAccess), PageFaultError::None);
    EXPECT_EQ(fault(range.address + PAGE, AddressSpace::WriteAccess), PageFaultError::OutOfMemory);

    // The page stays in the map and is installed once there is room.
    m_Harness.pageTable.setLimit(0);
    EXPECT_EQ(fault(range.address + PAGE, AddressSpace::WriteAccess), PageFaultError::None);
    EXPECT_EQ(m_Harness.physicalMemory.getAllocatedPageCount(), 2);
}

TEST_F(KeelPageFault, AnonymousMapPoolExhausted)
{
    VirtualRange first = mapAnonymous(PAGE, ReadWrite);
    VirtualRange second = mapAnonymous(PAGE, Read);
    ASSERT_EQ(fault(first.address, AddressSpace::WriteAccess), PageFaultError::None);

    m_Harness.caches.anonymousMaps.setLimit(m_Harness.caches.anonymousMaps.live());

    EXPECT_EQ(fault(second.address, AddressSpace::ReadAccess), PageFaultError::OutOfMemory);
    EXPECT_TRUE(m_Harness.entry(1).needsCopy);

    m_Harness.caches.anonymousMaps.setLimit(0);
    EXPECT_EQ(fault(second.address, AddressSpace::ReadAccess), PageFaultError::None);
}

TEST_F(KeelPageFault, AnonymousPagePoolExhausted)
{
    VirtualRange range = mapAnonymous(2 * PAGE, ReadWrite);
    ASSERT_EQ(fault(range.address, AddressSpace::WriteAccess), PageFaultError::None);

    m_Harness.caches.anonymousPages.setLimit(m_Harness.caches.anonymousPages.live());

    EXPECT_EQ(fault(range.address + PAGE, AddressSpace::WriteAccess), PageFaultError::OutOfMemory);
    EXPECT_EQ(m_Harness.physicalMemory.getAllocatedPageCount(), 1);

    m_Harness.caches.anonymousPages.setLimit(0);
}

TEST_F(KeelPageFault, ObjectReadMapsObjectPage)
{
    createObject(2);
    VirtualRange range = mapObject(2 * PAGE, 0, ReadWrite);

    ASSERT_EQ(fault(range.address + PAGE, AddressSpace::ReadAccess), PageFaultError::None);

    EXPECT_EQ(physical(range.address + PAGE), m_pObject->lookupPage(1));
    EXPECT_EQ(protection(range.address + PAGE), Read);
    EXPECT_EQ(m_Harness.contents(range.address + PAGE)[0], 2);

    Entry entry = m_Harness.entry(0);
    EXPECT_TRUE(entry.needsCopy);
    EXPECT_EQ(entry.anonymousMap.pMap, (AnonymousMap *) 0);
}

TEST_F(KeelPageFault, ObjectWriteCopiesPage)
{
    createObject(2);
    VirtualRange range = mapObject(2 * PAGE, 0, ReadWrite);

    ASSERT_EQ(fault(range.address, AddressSpace::ReadAccess), PageFaultError::None);
    ASSERT_EQ(fault(range.address, AddressSpace::WriteAccess), PageFaultError::None);

    physical_uintptr_t copy = physical(range.address);
    EXPECT_NE(copy, m_pObject->lookupPage(0));
    EXPECT_EQ(protection(range.address), ReadWrite);

    uint8_t *pContents = m_Harness.contents(range.address);
    EXPECT_EQ(pContents[0], 1);
    EXPECT_EQ(pContents[PAGE - 1], 1);

    pContents[0] = 0x77;
    uint8_t *pOriginal =
        reinterpret_cast<uint8_t *>(m_Harness.physicalMemory.mapPhysical(m_pObject->lookupPage(0)));
    EXPECT_EQ(pOriginal[0], 1);

    Entry entry = m_Harness.entry(0);
    EXPECT_FALSE(entry.needsCopy);
    ASSERT_NE(entry.anonymousMap.pMap, (AnonymousMap *) 0);
    EXPECT_EQ(entry.anonymousMap.pMap->getPagesInUse(), 1);

    // The other page still reads straight from the object.
    ASSERT_EQ(fault(range.address + PAGE, AddressSpace::ReadAccess), PageFaultError::None);
    EXPECT_EQ(physical(range.address + PAGE), m_pObject->lookupPage(1));
    EXPECT_EQ(protection(range.address + PAGE), Read);
}

TEST_F(KeelPageFault, ObjectOffsetSelectsPage)
{
    createObject(3);
    VirtualRange range = mapObject(PAGE, 2 * PAGE, Read);

    ASSERT_EQ(fault(range.address, AddressSpace::ReadAccess), PageFaultError::None);
    EXPECT_EQ(physical(range.address), m_pObject->lookupPage(2));
    EXPECT_EQ(m_Harness.contents(range.address)[0], 3);
}

TEST_F(KeelPageFault, ObjectPageNotResident)
{
    createObject(1);
    VirtualRange range = mapObject(2 * PAGE, 0, ReadWrite);

    EXPECT_EQ(fault(range.address + PAGE, AddressSpace::ReadAccess), PageFaultError::NotMapped);
    EXPECT_EQ(fault(range.address + PAGE, AddressSpace::WriteAccess), PageFaultError::NotMapped);
    EXPECT_EQ(physical(range.address + PAGE), 0);
}

TEST_F(KeelPageFault, ObjectMappingHoldsReference)
{
    createObject(1);
    VirtualRange range = mapObject(PAGE, 0, Read);

    {
        ReadLockGuard<MemoryObject> guard(*m_pObject);
        EXPECT_EQ(m_pObject->getReferenceCount(), 2);
    }

    m_Harness.addressSpace.unmap(range);

    ReadLockGuard<MemoryObject> guard(*m_pObject);
    EXPECT_EQ(m_pObject->getReferenceCount(), 1);
}

TEST_F(KeelPageFault, SharedPageIsCopiedOnWrite)
{
    VirtualRange range = mapAnonymous(2 * PAGE, ReadWrite);
    ASSERT_EQ(fault(range.address, AddressSpace::WriteAccess), PageFaultError::None);
    physical_uintptr_t original = physical(range.address);
    m_Harness.contents(range.address)[0] = 0x11;

    // Splitting leaves both halves on one map; the lower half then takes a
    // private copy of it, as a forked address space would.
    ASSERT_EQ(m_Harness.addressSpace.changeProtection(
                  VirtualRange(range.address + PAGE, PAGE),
                  AddressSpace::ChangeProtection::toProtection(Read)),
              ChangeProtectionError::None);
    ASSERT_EQ(m_Harness.entryCount(), 2);
    editEntry(0, [](Entry &entry) { entry.needsCopy = true; });
    m_Harness.pageTable.unmap(range);

    ASSERT_EQ(fault(range.address, AddressSpace::ReadAccess), PageFaultError::None);
    EXPECT_EQ(physical(range.address), original);
    EXPECT_EQ(protection(range.address), Read);

    Entry lower = m_Harness.entry(0);
    Entry upper = m_Harness.entry(1);
    EXPECT_FALSE(lower.needsCopy);
    EXPECT_NE(lower.anonymousMap.pMap, upper.anonymousMap.pMap);

    ASSERT_EQ(fault(range.address, AddressSpace::WriteAccess), PageFaultError::None);
    physical_uintptr_t copy = physical(range.address);
    EXPECT_NE(copy, original);
    EXPECT_EQ(protection(range.address), ReadWrite);
    EXPECT_EQ(m_Harness.contents(range.address)[0], 0x11);

    // The original stays with the upper half's map.
    AnonymousPage *pOriginal = upper.anonymousMap.pMap->lookup(0);
    ASSERT_NE(pOriginal, (AnonymousPage *) 0);
    EXPECT_EQ(pOriginal->getPhysicalPage(), original);
    {
        ReadLockGuard<AnonymousPage> guard(*pOriginal);
        EXPECT_EQ(pOriginal->getReferenceCount(), 1);
    }
    EXPECT_EQ(m_Harness.physicalMemory.getAllocatedPageCount(), 2);
}

TEST_F(KeelPageFault, WiredEntryFaultsWithMapWriteLocked)
{
    VirtualRange range = mapAnonymous(PAGE, ReadWrite);
    ASSERT_EQ(fault(range.address, AddressSpace::WriteAccess), PageFaultError::None);
    editEntry(0, [](Entry &entry) { entry.wiredCount = 1; });
    m_Harness.pageTable.unmap(range);

    EXPECT_EQ(fault(range.address, AddressSpace::ReadAccess), PageFaultError::None);
    EXPECT_EQ(protection(range.address), ReadWrite);

    editEntry(0, [](Entry &entry) { entry.wiredCount = 0; });
}

TEST_F(KeelPageFault, WiredReadOfSharedPageTakesPrivateCopy)
{
    VirtualRange range = mapAnonymous(2 * PAGE, ReadWrite);
    ASSERT_EQ(fault(range.address, AddressSpace::WriteAccess), PageFaultError::None);
    physical_uintptr_t original = physical(range.address);
    m_Harness.contents(range.address)[0] = 0x22;

    ASSERT_EQ(m_Harness.addressSpace.changeProtection(
                  VirtualRange(range.address + PAGE, PAGE),
                  AddressSpace::ChangeProtection::toProtection(Read)),
              ChangeProtectionError::None);
    ASSERT_EQ(m_Harness.entryCount(), 2);
    editEntry(0, [](Entry &entry)
    {
        entry.needsCopy = true;
        entry.wiredCount = 1;
    });
    m_Harness.pageTable.unmap(range);

    // A read of a wired read-write entry resolves it for writing.
    ASSERT_EQ(fault(range.address, AddressSpace::ReadAccess), PageFaultError::None);
    EXPECT_NE(physical(range.address), original);
    EXPECT_EQ(protection(range.address), ReadWrite);
    EXPECT_EQ(m_Harness.contents(range.address)[0], 0x22);
    EXPECT_FALSE(m_Harness.entry(0).needsCopy);
    EXPECT_EQ(m_Harness.physicalMemory.getAllocatedPageCount(), 2);

    editEntry(0, [](Entry &entry) { entry.wiredCount = 0; });
}

TEST_F(KeelPageFault, MaterialisingMapBumpsVersionOnce)
{
    VirtualRange range = mapAnonymous(4 * PAGE, ReadWrite);
    uint32_t version = m_Harness.version();

    ASSERT_EQ(fault(range.address + PAGE, AddressSpace::WriteAccess), PageFaultError::None);
    EXPECT_EQ(m_Harness.version(), version + 1);
    EXPECT_FALSE(m_Harness.entry(0).needsCopy);

    ASSERT_EQ(fault(range.address + 2 * PAGE, AddressSpace::WriteAccess), PageFaultError::None);
    ASSERT_EQ(fault(range.address, AddressSpace::ReadAccess), PageFaultError::None);
    EXPECT_EQ(m_Harness.version(), version + 1);
}

TEST_F(KeelPageFault, FailedObjectMapKeepsReferenceCount)
{
    createObject(1);
    VirtualRange occupied = mapAnonymous(PAGE, ReadWrite);

    AddressSpace::MapOptions options;
    options.hasBase = true;
    options.base = occupied.address;
    options.size = PAGE;
    options.protection = Read;
    options.pObject = m_pObject;

    VirtualRange result;
    EXPECT_EQ(m_Harness.addressSpace.map(options, result),
              MapError::RequestedRangeUnavailable);

    // Away from any neighbour a new entry is needed, and there is none.
    m_Harness.caches.entries.setLimit(m_Harness.caches.entries.live());
    options.base = occupied.address + 8 * PAGE;
    EXPECT_EQ(m_Harness.addressSpace.map(options, result), MapError::OutOfMemory);
    m_Harness.caches.entries.setLimit(0);

    {
        ReadLockGuard<MemoryObject> guard(*m_pObject);
        EXPECT_EQ(m_pObject->getReferenceCount(), 1);
    }
    EXPECT_EQ(m_Harness.entryCount(), 1);
}

TEST_F(KeelPageFault, ConcurrentFaultsShareOnePage)
{
    VirtualRange range = mapAnonymous(4 * PAGE, ReadWrite);

    std::vector<std::thread> workers;
    for (size_t t = 0; t < 8; ++t)
    {
        workers.push_back(std::thread([this, range, t]() {
            AddressSpace::AccessType access = (t & 1) ? AddressSpace::WriteAccess
                                                      : AddressSpace::ReadAccess;
            for (size_t page = 0; page < 4; ++page)
                EXPECT_EQ(fault(range.address + page * PAGE, access), PageFaultError::None);
        }));
    }

    for (size_t t = 0; t < workers.size(); ++t)
        workers[t].join();

    Entry entry = m_Harness.entry(0);
    ASSERT_NE(entry.anonymousMap.pMap, (AnonymousMap *) 0);
    EXPECT_EQ(entry.anonymousMap.pMap->getPagesInUse(), 4);
    EXPECT_EQ(m_Harness.physicalMemory.getAllocatedPageCount(), 4);
    EXPECT_EQ(m_Harness.pageTable.count(), 4);
}

TEST(KeelPageFaultNames, AccessAllowed)
{
    EXPECT_TRUE(FaultInfo::accessAllowed(Read, AddressSpace::ReadAccess));
    EXPECT_FALSE(FaultInfo::accessAllowed(Read, AddressSpace::WriteAccess));
    EXPECT_TRUE(FaultInfo::accessAllowed(ReadWrite, AddressSpace::WriteAccess));
    EXPECT_FALSE(FaultInfo::accessAllowed(ReadWrite, AddressSpace::ExecuteAccess));
    EXPECT_TRUE(FaultInfo::accessAllowed(Execute, AddressSpace::ExecuteAccess));
    EXPECT_FALSE(FaultInfo::accessAllowed(None, AddressSpace::ReadAccess));
}
