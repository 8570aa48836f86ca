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

#ifndef KEEL_TESTSUITE_MEMORYHARNESS_H
#define KEEL_TESTSUITE_MEMORYHARNESS_H

#include <gtest/gtest.h>

#include <core/processor/hosted/PhysicalMemoryManager.h>
#include <core/processor/hosted/PageTable.h>
#include <memory/AddressSpace.h>
#include <memory/AddressSpaceCaches.h>
#include <process/Process.h>

/** Base and size of the address space every harness creates. */
#define HARNESS_BASE 0x100000
#define HARNESS_SIZE 0x100000

/** Physical memory, a page table, pools and one address space over them. */
struct MemoryHarness
{
    MemoryHarness(size_t pageSize, size_t physicalPages, Environment environment,
                  const AddressSpaceCaches::Limits &limits = AddressSpaceCaches::Limits()) :
        physicalMemory(pageSize, physicalPages), pageTable(pageSize),
        caches(physicalMemory, limits),
        addressSpace("harness", VirtualRange(HARNESS_BASE, HARNESS_SIZE), environment,
                     pageTable, caches)
    {
    }

    ~MemoryHarness()
    {
        addressSpace.reinitializeAndUnmapAll();
    }

    /** Maps size bytes of zero-filled memory, at base if it is non-zero. */
    MapError::Type mapAnonymous(uintptr_t base, size_t size, Protection protection,
                                VirtualRange &result)
    {
        AddressSpace::MapOptions options;
        options.hasBase = base != 0;
        options.base = base;
        options.size = size;
        options.protection = protection;
        return addressSpace.map(options, result);
    }

    size_t entryCount()
    {
        ReadLockGuard<AddressSpace> guard(addressSpace);
        return addressSpace.getEntryCount();
    }

    /** A snapshot of the entry at index. */
    Entry entry(size_t index)
    {
        ReadLockGuard<AddressSpace> guard(addressSpace);
        return addressSpace.getEntry(index);
    }

    uint32_t version()
    {
        ReadLockGuard<AddressSpace> guard(addressSpace);
        return addressSpace.getEntriesVersion();
    }

    size_t mappedSize()
    {
        ReadLockGuard<AddressSpace> guard(addressSpace);
        return addressSpace.getMappedSize();
    }

    /** Entries are sorted, disjoint, inside the address space and never
     *  more permissive than their maximum. */
    void expectConsistent()
    {
        ReadLockGuard<AddressSpace> guard(addressSpace);

        const VirtualRange &range = addressSpace.getRange();
        for (size_t i = 0; i < addressSpace.getEntryCount(); ++i)
        {
            const Entry &current = addressSpace.getEntry(i);
            EXPECT_TRUE(range.fullyContains(current.range));
            EXPECT_LE(current.protection, current.maxProtection);
            EXPECT_NE(current.range.size, 0);

            if (i)
            {
                const Entry &previous = addressSpace.getEntry(i - 1);
                EXPECT_LE(previous.range.endBound(), current.range.address);
            }
        }
    }

    /** Whether the page table holds a translation for address, and with
     *  what protection. */
    bool translated(uintptr_t address, Protection &protection)
    {
        HostedPageTable::Mapping mapping;
        if (!pageTable.getMapping(address, mapping))
            return false;
        protection = mapping.protection;
        return true;
    }

    /** The bytes behind a translated address. */
    uint8_t *contents(uintptr_t address)
    {
        HostedPageTable::Mapping mapping;
        if (!pageTable.getMapping(address, mapping))
            return 0;
        return reinterpret_cast<uint8_t *>(physicalMemory.mapPhysical(mapping.physical));
    }

    HostedPhysicalMemoryManager physicalMemory;
    HostedPageTable pageTable;
    AddressSpaceCaches caches;
    AddressSpace addressSpace;
};

#endif
