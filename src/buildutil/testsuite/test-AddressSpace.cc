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

#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include <Log.h>
#include <memory/AnonymousMap.h>

#include "MemoryHarness.h"

#define PAGE 0x1000

class KeelAddressSpace : public ::testing::Test
{
    protected:
        KeelAddressSpace() : m_Harness(PAGE, 64, Environment::kernel())
        {
        }

        virtual void TearDown()
        {
            m_Harness.expectConsistent();
        }

        VirtualRange mapAt(uintptr_t base, size_t size, Protection protection)
        {
            VirtualRange result;
            EXPECT_EQ(m_Harness.mapAnonymous(base, size, protection, result), MapError::None);
            return result;
        }

        ChangeProtectionError::Type protect(uintptr_t base, size_t size, Protection protection)
        {
            return m_Harness.addressSpace.changeProtection(
                VirtualRange(base, size), AddressSpace::ChangeProtection::toProtection(protection));
        }

        MemoryHarness m_Harness;
};

TEST_F(KeelAddressSpace, StartsEmpty)
{
    EXPECT_EQ(m_Harness.entryCount(), 0);
    EXPECT_EQ(m_Harness.version(), 0);
    EXPECT_EQ(m_Harness.mappedSize(), 0);
    EXPECT_EQ(m_Harness.addressSpace.getPageSize(), PAGE);
}

TEST_F(KeelAddressSpace, MapAnywhereUsesLowestGap)
{
    VirtualRange result;
    ASSERT_EQ(m_Harness.mapAnonymous(0, 3 * PAGE, ReadWrite, result), MapError::None);

    EXPECT_EQ(result, VirtualRange(HARNESS_BASE, 3 * PAGE));
    ASSERT_EQ(m_Harness.entryCount(), 1);
    EXPECT_EQ(m_Harness.version(), 1);

    Entry entry = m_Harness.entry(0);
    EXPECT_EQ(entry.protection, ReadWrite);
    EXPECT_EQ(entry.maxProtection, ReadWrite);
    EXPECT_TRUE(entry.needsCopy);
    EXPECT_TRUE(entry.copyOnWrite);
    EXPECT_EQ(entry.anonymousMap.pMap, (AnonymousMap *) 0);
}

TEST_F(KeelAddressSpace, MapAnywhereSkipsSmallGaps)
{
    mapAt(HARNESS_BASE, PAGE, ReadWrite);
    mapAt(HARNESS_BASE + 2 * PAGE, PAGE, Read);

    VirtualRange result;
    ASSERT_EQ(m_Harness.mapAnonymous(0, 2 * PAGE, ReadWrite, result), MapError::None);
    EXPECT_EQ(result.address, HARNESS_BASE + 3 * PAGE);

    ASSERT_EQ(m_Harness.mapAnonymous(0, PAGE, Execute, result), MapError::None);
    EXPECT_EQ(result.address, HARNESS_BASE + PAGE);

    EXPECT_EQ(m_Harness.entryCount(), 4);
}

TEST_F(KeelAddressSpace, MapZeroSize)
{
    VirtualRange result;
    EXPECT_EQ(m_Harness.mapAnonymous(0, 0, ReadWrite, result), MapError::ZeroSize);
    EXPECT_EQ(m_Harness.version(), 0);
}

TEST_F(KeelAddressSpace, MapOverOccupiedFixedRange)
{
    mapAt(HARNESS_BASE + 4 * PAGE, 2 * PAGE, ReadWrite);
    uint32_t version = m_Harness.version();

    VirtualRange result;
    EXPECT_EQ(m_Harness.mapAnonymous(HARNESS_BASE + 5 * PAGE, 2 * PAGE, ReadWrite, result),
              MapError::RequestedRangeUnavailable);
    EXPECT_EQ(m_Harness.mapAnonymous(HARNESS_BASE + 3 * PAGE, 2 * PAGE, ReadWrite, result),
              MapError::RequestedRangeUnavailable);

    EXPECT_EQ(m_Harness.entryCount(), 1);
    EXPECT_EQ(m_Harness.version(), version);
    EXPECT_EQ(m_Harness.entry(0).range, VirtualRange(HARNESS_BASE + 4 * PAGE, 2 * PAGE));
}

TEST_F(KeelAddressSpace, MapOutsideRange)
{
    VirtualRange result;
    EXPECT_EQ(m_Harness.mapAnonymous(HARNESS_BASE + HARNESS_SIZE, PAGE, Read, result),
              MapError::RequestedRangeUnavailable);
    EXPECT_EQ(m_Harness.mapAnonymous(HARNESS_BASE + HARNESS_SIZE - PAGE, 2 * PAGE, Read, result),
              MapError::RequestedRangeUnavailable);
    EXPECT_EQ(m_Harness.mapAnonymous(0, HARNESS_SIZE + PAGE, Read, result),
              MapError::RequestedRangeUnavailable);
    EXPECT_EQ(m_Harness.entryCount(), 0);
}

TEST_F(KeelAddressSpace, HugeSizesAreRejected)
{
    mapAt(HARNESS_BASE + 4 * PAGE, PAGE, ReadWrite);
    uint32_t version = m_Harness.version();
    const size_t huge = ~static_cast<size_t>(0) - 10;

    VirtualRange result;
    EXPECT_EQ(m_Harness.mapAnonymous(0, huge, ReadWrite, result),
              MapError::RequestedRangeUnavailable);
    EXPECT_EQ(m_Harness.mapAnonymous(HARNESS_BASE + 8 * PAGE, huge, ReadWrite, result),
              MapError::RequestedRangeUnavailable);
    // Fits before rounding, not after.
    EXPECT_EQ(m_Harness.mapAnonymous(HARNESS_BASE + 1, HARNESS_SIZE, ReadWrite, result),
              MapError::RequestedRangeUnavailable);

    ASSERT_EQ(m_Harness.entryCount(), 1);
    EXPECT_EQ(m_Harness.entry(0).range, VirtualRange(HARNESS_BASE + 4 * PAGE, PAGE));
    EXPECT_EQ(m_Harness.version(), version);
}

TEST_F(KeelAddressSpace, UnmapRunningOffTheTop)
{
    mapAt(HARNESS_BASE, PAGE, ReadWrite);
    mapAt(HARNESS_BASE + 4 * PAGE, PAGE, Read);

    EXPECT_EQ(m_Harness.addressSpace.unmap(VirtualRange(HARNESS_BASE + 2 * PAGE,
                                                        ~static_cast<size_t>(0))),
              UnmapError::None);

    ASSERT_EQ(m_Harness.entryCount(), 1);
    EXPECT_EQ(m_Harness.entry(0).range, VirtualRange(HARNESS_BASE, PAGE));
}

TEST_F(KeelAddressSpace, ChangeProtectionRunningOffTheTop)
{
    mapAt(HARNESS_BASE + PAGE, 2 * PAGE, ReadWrite);

    EXPECT_EQ(protect(HARNESS_BASE + 2 * PAGE, ~static_cast<size_t>(0) - 1, Read),
              ChangeProtectionError::None);

    ASSERT_EQ(m_Harness.entryCount(), 2);
    EXPECT_EQ(m_Harness.entry(0).range, VirtualRange(HARNESS_BASE + PAGE, PAGE));
    EXPECT_EQ(m_Harness.entry(0).protection, ReadWrite);
    EXPECT_EQ(m_Harness.entry(1).range, VirtualRange(HARNESS_BASE + 2 * PAGE, PAGE));
    EXPECT_EQ(m_Harness.entry(1).protection, Read);
}

TEST_F(KeelAddressSpace, MapWholeRange)
{
    VirtualRange result;
    ASSERT_EQ(m_Harness.mapAnonymous(0, HARNESS_SIZE, Read, result), MapError::None);
    EXPECT_EQ(result, m_Harness.addressSpace.getRange());

    EXPECT_EQ(m_Harness.mapAnonymous(0, PAGE, Read, result),
              MapError::RequestedRangeUnavailable);
}

TEST_F(KeelAddressSpace, MapRejectsProtectionAboveMaximum)
{
    AddressSpace::MapOptions options;
    options.size = PAGE;
    options.protection = ReadWrite;
    options.hasMaxProtection = true;
    options.maxProtection = Read;

    VirtualRange result;
    EXPECT_EQ(m_Harness.addressSpace.map(options, result), MapError::MaxProtectionExceeded);

    options.protection = None;
    options.maxProtection = None;
    EXPECT_EQ(m_Harness.addressSpace.map(options, result), MapError::MaxProtectionExceeded);

    EXPECT_EQ(m_Harness.entryCount(), 0);
}

TEST_F(KeelAddressSpace, MapWithWiderMaximum)
{
    AddressSpace::MapOptions options;
    options.size = PAGE;
    options.protection = Read;
    options.hasMaxProtection = true;
    options.maxProtection = ReadWrite;

    VirtualRange result;
    ASSERT_EQ(m_Harness.addressSpace.map(options, result), MapError::None);
    EXPECT_EQ(m_Harness.entry(0).maxProtection, ReadWrite);

    EXPECT_EQ(protect(result.address, PAGE, ReadWrite), ChangeProtectionError::None);
    EXPECT_EQ(m_Harness.entry(0).protection, ReadWrite);
}

TEST_F(KeelAddressSpace, UnalignedMapIsWidened)
{
    VirtualRange result;
    ASSERT_EQ(m_Harness.mapAnonymous(HARNESS_BASE + 0x800, PAGE, Read, result), MapError::None);
    EXPECT_EQ(result, VirtualRange(HARNESS_BASE, 2 * PAGE));
}

TEST_F(KeelAddressSpace, AdjacentMapsMerge)
{
    mapAt(HARNESS_BASE, PAGE, ReadWrite);
    mapAt(HARNESS_BASE + PAGE, PAGE, ReadWrite);

    ASSERT_EQ(m_Harness.entryCount(), 1);
    EXPECT_EQ(m_Harness.entry(0).range, VirtualRange(HARNESS_BASE, 2 * PAGE));
}

TEST_F(KeelAddressSpace, AdjacentMapsWithDifferentProtectionStaySeparate)
{
    mapAt(HARNESS_BASE, PAGE, ReadWrite);
    mapAt(HARNESS_BASE + PAGE, PAGE, Read);

    ASSERT_EQ(m_Harness.entryCount(), 2);
    EXPECT_EQ(m_Harness.entry(0).protection, ReadWrite);
    EXPECT_EQ(m_Harness.entry(1).protection, Read);
}

TEST_F(KeelAddressSpace, MapFillingGapMergesBothSides)
{
    mapAt(HARNESS_BASE, PAGE, Read);
    mapAt(HARNESS_BASE + 2 * PAGE, PAGE, Read);
    ASSERT_EQ(m_Harness.entryCount(), 2);

    mapAt(HARNESS_BASE + PAGE, PAGE, Read);

    ASSERT_EQ(m_Harness.entryCount(), 1);
    EXPECT_EQ(m_Harness.entry(0).range, VirtualRange(HARNESS_BASE, 3 * PAGE));
    EXPECT_EQ(m_Harness.caches.entries.live(), 1);
}

TEST_F(KeelAddressSpace, FaultedEntryAbsorbsNewNeighbour)
{
    VirtualRange first = mapAt(HARNESS_BASE, 2 * PAGE, ReadWrite);
    ASSERT_EQ(m_Harness.addressSpace.handlePageFault(first.address, AddressSpace::WriteAccess),
              PageFaultError::None);

    mapAt(HARNESS_BASE + 2 * PAGE, PAGE, ReadWrite);

    ASSERT_EQ(m_Harness.entryCount(), 1);
    Entry entry = m_Harness.entry(0);
    EXPECT_EQ(entry.range.size, 3 * PAGE);
    EXPECT_FALSE(entry.needsCopy);
    ASSERT_NE(entry.anonymousMap.pMap, (AnonymousMap *) 0);
    EXPECT_EQ(entry.anonymousMap.pMap->getNumberOfPages(), 3);
}

TEST_F(KeelAddressSpace, MapThenUnmapRestores)
{
    mapAt(HARNESS_BASE, 2 * PAGE, ReadWrite);
    mapAt(HARNESS_BASE + 8 * PAGE, PAGE, Read);

    size_t entries = m_Harness.entryCount();
    size_t mapped = m_Harness.mappedSize();

    VirtualRange extra = mapAt(HARNESS_BASE + 4 * PAGE, 3 * PAGE, Execute);
    EXPECT_EQ(m_Harness.entryCount(), entries + 1);

    EXPECT_EQ(m_Harness.addressSpace.unmap(extra), UnmapError::None);
    EXPECT_EQ(m_Harness.entryCount(), entries);
    EXPECT_EQ(m_Harness.mappedSize(), mapped);
}

TEST_F(KeelAddressSpace, UnmapPunchesHole)
{
    mapAt(HARNESS_BASE, 4 * PAGE, ReadWrite);

    EXPECT_EQ(m_Harness.addressSpace.unmap(VirtualRange(HARNESS_BASE + PAGE, 2 * PAGE)),
              UnmapError::None);

    ASSERT_EQ(m_Harness.entryCount(), 2);
    EXPECT_EQ(m_Harness.entry(0).range, VirtualRange(HARNESS_BASE, PAGE));
    EXPECT_EQ(m_Harness.entry(1).range, VirtualRange(HARNESS_BASE + 3 * PAGE, PAGE));
}

TEST_F(KeelAddressSpace, UnmapAcrossEntries)
{
    mapAt(HARNESS_BASE, 2 * PAGE, ReadWrite);
    mapAt(HARNESS_BASE + 2 * PAGE, 2 * PAGE, Read);
    mapAt(HARNESS_BASE + 4 * PAGE, 2 * PAGE, ReadWrite);

    EXPECT_EQ(m_Harness.addressSpace.unmap(VirtualRange(HARNESS_BASE + PAGE, 4 * PAGE)),
              UnmapError::None);

    ASSERT_EQ(m_Harness.entryCount(), 2);
    EXPECT_EQ(m_Harness.entry(0).range, VirtualRange(HARNESS_BASE, PAGE));
    EXPECT_EQ(m_Harness.entry(1).range, VirtualRange(HARNESS_BASE + 5 * PAGE, PAGE));
    EXPECT_EQ(m_Harness.caches.entries.live(), 2);
}

TEST_F(KeelAddressSpace, UnmapNothing)
{
    mapAt(HARNESS_BASE, PAGE, ReadWrite);
    uint32_t version = m_Harness.version();

    EXPECT_EQ(m_Harness.addressSpace.unmap(VirtualRange(HARNESS_BASE + 4 * PAGE, PAGE)),
              UnmapError::None);
    EXPECT_EQ(m_Harness.addressSpace.unmap(VirtualRange(HARNESS_BASE, 0)), UnmapError::None);
    EXPECT_EQ(m_Harness.version(), version);
}

TEST_F(KeelAddressSpace, UnmapRemovesTranslations)
{
    VirtualRange range = mapAt(HARNESS_BASE, 2 * PAGE, ReadWrite);
    m_Harness.addressSpace.handlePageFault(range.address, AddressSpace::WriteAccess);
    m_Harness.addressSpace.handlePageFault(range.address + PAGE, AddressSpace::WriteAccess);
    EXPECT_EQ(m_Harness.pageTable.count(), 2);

    m_Harness.addressSpace.unmap(VirtualRange(range.address + PAGE, PAGE));

    Protection protection;
    EXPECT_TRUE(m_Harness.translated(range.address, protection));
    EXPECT_FALSE(m_Harness.translated(range.address + PAGE, protection));
}

TEST(KeelAddressSpaceSmallPages, ChangeProtectionSplitsEntry)
{
    MemoryHarness harness(0x800, 16, Environment::kernel());

    VirtualRange result;
    ASSERT_EQ(harness.mapAnonymous(HARNESS_BASE, 0x2000, ReadWrite, result), MapError::None);

    EXPECT_EQ(harness.addressSpace.changeProtection(
                  VirtualRange(HARNESS_BASE + 0x800, 0x1000),
                  AddressSpace::ChangeProtection::toProtection(Read)),
              ChangeProtectionError::None);

    ASSERT_EQ(harness.entryCount(), 3);
    EXPECT_EQ(harness.entry(0).range, VirtualRange(HARNESS_BASE, 0x800));
    EXPECT_EQ(harness.entry(0).protection, ReadWrite);
    EXPECT_EQ(harness.entry(1).range, VirtualRange(HARNESS_BASE + 0x800, 0x1000));
    EXPECT_EQ(harness.entry(1).protection, Read);
    EXPECT_EQ(harness.entry(2).range, VirtualRange(HARNESS_BASE + 0x1800, 0x800));
    EXPECT_EQ(harness.entry(2).protection, ReadWrite);

    harness.expectConsistent();
}

TEST_F(KeelAddressSpace, RepeatedChangeProtectionIsNoOp)
{
    mapAt(HARNESS_BASE, 4 * PAGE, ReadWrite);

    ASSERT_EQ(protect(HARNESS_BASE + PAGE, PAGE, Read), ChangeProtectionError::None);
    uint32_t version = m_Harness.version();
    size_t entries = m_Harness.entryCount();

    EXPECT_EQ(protect(HARNESS_BASE + PAGE, PAGE, Read), ChangeProtectionError::None);
    EXPECT_EQ(m_Harness.version(), version);
    EXPECT_EQ(m_Harness.entryCount(), entries);
}

TEST_F(KeelAddressSpace, RestoringProtectionMergesBack)
{
    mapAt(HARNESS_BASE, 4 * PAGE, ReadWrite);

    ASSERT_EQ(protect(HARNESS_BASE + PAGE, 2 * PAGE, Read), ChangeProtectionError::None);
    ASSERT_EQ(m_Harness.entryCount(), 3);

    ASSERT_EQ(protect(HARNESS_BASE + PAGE, 2 * PAGE, ReadWrite), ChangeProtectionError::None);
    ASSERT_EQ(m_Harness.entryCount(), 1);
    EXPECT_EQ(m_Harness.entry(0).range, VirtualRange(HARNESS_BASE, 4 * PAGE));
    EXPECT_EQ(m_Harness.caches.entries.live(), 1);
}

TEST_F(KeelAddressSpace, ChangeProtectionSpanningEntries)
{
    mapAt(HARNESS_BASE, 2 * PAGE, ReadWrite);
    mapAt(HARNESS_BASE + 2 * PAGE, 2 * PAGE, Read);

    ASSERT_EQ(protect(HARNESS_BASE, 4 * PAGE, Read), ChangeProtectionError::None);

    // Still two entries: their maximum protections differ.
    ASSERT_EQ(m_Harness.entryCount(), 2);
    EXPECT_EQ(m_Harness.entry(0).protection, Read);
    EXPECT_EQ(m_Harness.entry(0).maxProtection, ReadWrite);
    EXPECT_EQ(m_Harness.entry(1).protection, Read);
    EXPECT_EQ(m_Harness.entry(1).maxProtection, Read);
}

TEST_F(KeelAddressSpace, ChangeProtectionOfHoleIsNothing)
{
    mapAt(HARNESS_BASE, PAGE, ReadWrite);
    uint32_t version = m_Harness.version();

    EXPECT_EQ(protect(HARNESS_BASE + 8 * PAGE, PAGE, Read), ChangeProtectionError::None);
    EXPECT_EQ(m_Harness.version(), version);
}

TEST_F(KeelAddressSpace, RaisingMaximumFails)
{
    mapAt(HARNESS_BASE, 2 * PAGE, Read);
    uint32_t version = m_Harness.version();

    EXPECT_EQ(m_Harness.addressSpace.changeProtection(
                  VirtualRange(HARNESS_BASE, PAGE),
                  AddressSpace::ChangeProtection::toMaxProtection(ReadWrite)),
              ChangeProtectionError::MaxProtectionIncreased);

    ASSERT_EQ(m_Harness.entryCount(), 1);
    EXPECT_EQ(m_Harness.entry(0).maxProtection, Read);
    EXPECT_EQ(m_Harness.version(), version);
}

TEST_F(KeelAddressSpace, ProtectionAboveMaximumFails)
{
    mapAt(HARNESS_BASE, 2 * PAGE, Read);

    EXPECT_EQ(protect(HARNESS_BASE, PAGE, ReadWrite), ChangeProtectionError::MaxProtectionExceeded);
    EXPECT_EQ(m_Harness.entryCount(), 1);
    EXPECT_EQ(m_Harness.entry(0).protection, Read);
}

TEST_F(KeelAddressSpace, LoweringMaximumBelowProtectionFails)
{
    mapAt(HARNESS_BASE, 2 * PAGE, ReadWrite);

    EXPECT_EQ(m_Harness.addressSpace.changeProtection(
                  VirtualRange(HARNESS_BASE, PAGE),
                  AddressSpace::ChangeProtection::toMaxProtection(Read)),
              ChangeProtectionError::MaxProtectionExceeded);

    EXPECT_EQ(m_Harness.addressSpace.changeProtection(
                  VirtualRange(HARNESS_BASE, PAGE),
                  AddressSpace::ChangeProtection::toMaxProtection(None)),
              ChangeProtectionError::MaxProtectionExceeded);

    EXPECT_EQ(m_Harness.addressSpace.changeProtection(
                  VirtualRange(HARNESS_BASE, PAGE),
                  AddressSpace::ChangeProtection::toBoth(Read, Read)),
              ChangeProtectionError::None);

    ASSERT_EQ(m_Harness.entryCount(), 2);
    EXPECT_EQ(m_Harness.entry(0).protection, Read);
    EXPECT_EQ(m_Harness.entry(0).maxProtection, Read);
    EXPECT_EQ(m_Harness.entry(1).maxProtection, ReadWrite);
}

TEST_F(KeelAddressSpace, ChangeProtectionUpdatesTranslations)
{
    VirtualRange range = mapAt(HARNESS_BASE, 2 * PAGE, ReadWrite);
    ASSERT_EQ(m_Harness.addressSpace.handlePageFault(range.address, AddressSpace::WriteAccess),
              PageFaultError::None);

    Protection protection;
    ASSERT_TRUE(m_Harness.translated(range.address, protection));
    EXPECT_EQ(protection, ReadWrite);

    ASSERT_EQ(protect(range.address, 2 * PAGE, Read), ChangeProtectionError::None);
    ASSERT_TRUE(m_Harness.translated(range.address, protection));
    EXPECT_EQ(protection, Read);

    // Writable again only through the next write fault.
    ASSERT_EQ(protect(range.address, 2 * PAGE, ReadWrite), ChangeProtectionError::None);
    ASSERT_TRUE(m_Harness.translated(range.address, protection));
    EXPECT_EQ(protection, Read);

    ASSERT_EQ(protect(range.address, 2 * PAGE, None), ChangeProtectionError::None);
    EXPECT_FALSE(m_Harness.translated(range.address, protection));
}

TEST_F(KeelAddressSpace, EntryPoolExhaustion)
{
    mapAt(HARNESS_BASE, 4 * PAGE, ReadWrite);
    m_Harness.caches.entries.setLimit(m_Harness.caches.entries.live());
    uint32_t version = m_Harness.version();

    VirtualRange result;
    EXPECT_EQ(m_Harness.mapAnonymous(HARNESS_BASE + 8 * PAGE, PAGE, ReadWrite, result),
              MapError::OutOfMemory);
    EXPECT_EQ(m_Harness.addressSpace.unmap(VirtualRange(HARNESS_BASE + PAGE, PAGE)),
              UnmapError::OutOfMemory);
    EXPECT_EQ(protect(HARNESS_BASE + PAGE, PAGE, Read), ChangeProtectionError::OutOfMemory);

    // Merging needs no new entry.
    EXPECT_EQ(m_Harness.mapAnonymous(HARNESS_BASE + 4 * PAGE, PAGE, ReadWrite, result),
              MapError::None);

    ASSERT_EQ(m_Harness.entryCount(), 1);
    EXPECT_EQ(m_Harness.entry(0).range, VirtualRange(HARNESS_BASE, 5 * PAGE));
    EXPECT_EQ(m_Harness.entry(0).protection, ReadWrite);
    EXPECT_EQ(m_Harness.version(), version + 1);

    m_Harness.caches.entries.setLimit(0);
}

TEST_F(KeelAddressSpace, PrintRendersEveryEntry)
{
    class Capture : public Log::LogCallback
    {
        public:
            virtual void callback(const char *str)
            {
                text += str;
            }

            std::string text;
    };

    mapAt(HARNESS_BASE, 2 * PAGE, ReadWrite);
    mapAt(HARNESS_BASE + 4 * PAGE, PAGE, Read);

    Capture capture;
    Log::instance().installCallback(&capture, true);
    m_Harness.addressSpace.print();
    Log::instance().removeCallback(&capture);

    EXPECT_NE(capture.text.find("AddressSpace{ name: harness"), std::string::npos);
    EXPECT_NE(capture.text.find("environment: kernel, entries: 2, version: 2"), std::string::npos);
    EXPECT_NE(capture.text.find("Entry{ range: [0x100000, 0x102000), protection: read_write"),
              std::string::npos);
    EXPECT_NE(capture.text.find("Entry{ range: [0x104000, 0x105000), protection: read,"),
              std::string::npos);
}

TEST_F(KeelAddressSpace, ReinitializeUnmapsEverything)
{
    VirtualRange range = mapAt(HARNESS_BASE, 2 * PAGE, ReadWrite);
    mapAt(HARNESS_BASE + 8 * PAGE, PAGE, Read);
    m_Harness.addressSpace.handlePageFault(range.address, AddressSpace::WriteAccess);

    m_Harness.addressSpace.reinitializeAndUnmapAll();

    EXPECT_EQ(m_Harness.entryCount(), 0);
    EXPECT_EQ(m_Harness.version(), 0);
    EXPECT_EQ(m_Harness.pageTable.count(), 0);
    EXPECT_EQ(m_Harness.physicalMemory.getAllocatedPageCount(), 0);
    EXPECT_EQ(m_Harness.caches.entries.live(), 0);
    EXPECT_EQ(m_Harness.caches.anonymousMaps.live(), 0);

    m_Harness.addressSpace.deinit();
}

class KeelUserAddressSpace : public ::testing::Test
{
    protected:
        KeelUserAddressSpace() :
            m_Process(1, "init"), m_Harness(PAGE, 64, Environment::user(&m_Process))
        {
        }

        Process m_Process;
        MemoryHarness m_Harness;
};

TEST_F(KeelUserAddressSpace, RetargetTakesProcessName)
{
    Process other(2, "shell");
    m_Harness.addressSpace.retarget(&other);

    EXPECT_STREQ(m_Harness.addressSpace.getName(), "shell");
    EXPECT_EQ(m_Harness.addressSpace.getEnvironment().pProcess, &other);
    EXPECT_TRUE(m_Harness.addressSpace.getEnvironment().isUser());
}

TEST_F(KeelUserAddressSpace, RetargetAfterReinitialize)
{
    VirtualRange result;
    ASSERT_EQ(m_Harness.mapAnonymous(0, PAGE, Read, result), MapError::None);
    m_Harness.addressSpace.reinitializeAndUnmapAll();

    Process other(2, "shell");
    m_Harness.addressSpace.retarget(&other);
    EXPECT_STREQ(m_Harness.addressSpace.getName(), "shell");
}

TEST_F(KeelUserAddressSpace, UnmapFreesPagesImmediately)
{
    VirtualRange result;
    ASSERT_EQ(m_Harness.mapAnonymous(0, 4 * PAGE, ReadWrite, result), MapError::None);
    m_Harness.addressSpace.handlePageFault(result.address, AddressSpace::WriteAccess);
    m_Harness.addressSpace.handlePageFault(result.address + 3 * PAGE, AddressSpace::WriteAccess);
    EXPECT_EQ(m_Harness.physicalMemory.getAllocatedPageCount(), 2);

    m_Harness.addressSpace.unmap(VirtualRange(result.address + 2 * PAGE, 2 * PAGE));
    EXPECT_EQ(m_Harness.physicalMemory.getAllocatedPageCount(), 1);
}

TEST_F(KeelAddressSpace, KernelUnmapKeepsPagesUntilMapDies)
{
    VirtualRange range = mapAt(HARNESS_BASE, 4 * PAGE, ReadWrite);
    m_Harness.addressSpace.handlePageFault(range.address, AddressSpace::WriteAccess);
    m_Harness.addressSpace.handlePageFault(range.address + 3 * PAGE, AddressSpace::WriteAccess);
    EXPECT_EQ(m_Harness.physicalMemory.getAllocatedPageCount(), 2);

    m_Harness.addressSpace.unmap(VirtualRange(range.address + 2 * PAGE, 2 * PAGE));
    EXPECT_EQ(m_Harness.physicalMemory.getAllocatedPageCount(), 2);

    m_Harness.addressSpace.unmap(VirtualRange(range.address, 2 * PAGE));
    EXPECT_EQ(m_Harness.physicalMemory.getAllocatedPageCount(), 0);
}

TEST_F(KeelAddressSpace, ReusedSlotsReadAsZero)
{
    VirtualRange range = mapAt(HARNESS_BASE, 2 * PAGE, ReadWrite);
    uintptr_t second = range.address + PAGE;

    ASSERT_EQ(m_Harness.addressSpace.handlePageFault(second, AddressSpace::WriteAccess),
              PageFaultError::None);
    m_Harness.contents(second)[0] = 0x5A;

    // The kernel keeps the page in the map, but a new mapping over the same
    // addresses must not see it.
    m_Harness.addressSpace.unmap(VirtualRange(second, PAGE));
    mapAt(second, PAGE, ReadWrite);
    ASSERT_EQ(m_Harness.entryCount(), 1);

    ASSERT_EQ(m_Harness.addressSpace.handlePageFault(second, AddressSpace::ReadAccess),
              PageFaultError::None);
    EXPECT_EQ(m_Harness.contents(second)[0], 0);
}

TEST_F(KeelAddressSpace, ConcurrentMappersStayConsistent)
{
    const size_t threads = 4;
    const size_t iterations = 200;
    const size_t slice = HARNESS_SIZE / threads;

    std::vector<std::thread> workers;
    for (size_t t = 0; t < threads; ++t)
    {
        workers.push_back(std::thread([this, t, slice, iterations]() {
            uintptr_t base = HARNESS_BASE + t * slice;
            for (size_t i = 0; i < iterations; ++i)
            {
                VirtualRange result;
                uintptr_t address = base + (i % 4) * PAGE;
                if (m_Harness.mapAnonymous(address, PAGE, ReadWrite, result) != MapError::None)
                    continue;

                m_Harness.addressSpace.handlePageFault(address, AddressSpace::WriteAccess);
                m_Harness.addressSpace.changeProtection(
                    result, AddressSpace::ChangeProtection::toProtection(Read));

                if (i % 3)
                    m_Harness.addressSpace.unmap(result);
            }

            m_Harness.addressSpace.unmap(VirtualRange(base, slice));
        }));
    }

    for (size_t t = 0; t < workers.size(); ++t)
        workers[t].join();

    EXPECT_EQ(m_Harness.entryCount(), 0);
    EXPECT_EQ(m_Harness.physicalMemory.getAllocatedPageCount(), 0);
}

TEST(KeelAddressSpaceDeathTest, DeinitWithEntries)
{
    MemoryHarness harness(PAGE, 4, Environment::kernel());

    VirtualRange result;
    ASSERT_EQ(harness.mapAnonymous(0, PAGE, Read, result), MapError::None);
    EXPECT_DEATH(harness.addressSpace.deinit(), "deinit with 1 entries");
}

TEST(KeelAddressSpaceDeathTest, RetargetKernel)
{
    MemoryHarness harness(PAGE, 4, Environment::kernel());
    Process process(3, "daemon");
    EXPECT_DEATH(harness.addressSpace.retarget(&process), "only user address spaces");
}

TEST(KeelAddressSpaceDeathTest, RetargetInUse)
{
    Process process(1, "init");
    MemoryHarness harness(PAGE, 4, Environment::user(&process));

    VirtualRange result;
    ASSERT_EQ(harness.mapAnonymous(0, PAGE, Read, result), MapError::None);
    EXPECT_DEATH(harness.addressSpace.retarget(&process), "retargeted while in use");
}

TEST(KeelAddressSpaceDeathTest, UnalignedRange)
{
    HostedPhysicalMemoryManager physicalMemory(PAGE, 1);
    HostedPageTable pageTable(PAGE);
    AddressSpaceCaches caches(physicalMemory);

    EXPECT_DEATH(AddressSpace("broken", VirtualRange(0x1800, PAGE), Environment::kernel(),
                              pageTable, caches),
                 "not page aligned");
}

TEST(KeelAddressSpaceNames, ErrorNames)
{
    EXPECT_STREQ(mapErrorName(MapError::RequestedRangeUnavailable), "RequestedRangeUnavailable");
    EXPECT_STREQ(changeProtectionErrorName(ChangeProtectionError::MaxProtectionIncreased),
                 "MaxProtectionIncreased");
    EXPECT_STREQ(pageFaultErrorName(PageFaultError::NotMapped), "NotMapped");
}
