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

#include <benchmark/benchmark.h>

#include <core/processor/hosted/PhysicalMemoryManager.h>
#include <core/processor/hosted/PageTable.h>
#include <memory/AddressSpace.h>
#include <memory/AddressSpaceCaches.h>

#define PAGE 0x1000
#define BASE 0x100000

/** Everything an address space needs, sized for count pages. */
struct Fixture
{
    Fixture(size_t count) :
        physicalMemory(PAGE, count), pageTable(PAGE), caches(physicalMemory),
        addressSpace("bench", VirtualRange(BASE, 4 * count * PAGE), Environment::kernel(),
                     pageTable, caches)
    {
    }

    ~Fixture()
    {
        addressSpace.reinitializeAndUnmapAll();
    }

    MapError::Type map(uintptr_t base, size_t size, Protection protection)
    {
        AddressSpace::MapOptions options;
        options.hasBase = true;
        options.base = base;
        options.size = size;
        options.protection = protection;

        VirtualRange result;
        return addressSpace.map(options, result);
    }

    HostedPhysicalMemoryManager physicalMemory;
    HostedPageTable pageTable;
    AddressSpaceCaches caches;
    AddressSpace addressSpace;
};

// Alternating protections so that no two entries merge.
static void BM_AddressSpaceMapDistinct(benchmark::State &state)
{
    size_t count = state.range(0);

    while (state.KeepRunning())
    {
        state.PauseTiming();
        Fixture fixture(count);
        state.ResumeTiming();

        for (size_t i = 0; i < count; ++i)
            fixture.map(BASE + i * PAGE, PAGE, (i & 1) ? Read : ReadWrite);
    }

    state.SetItemsProcessed(int64_t(state.iterations()) * int64_t(count));
}

static void BM_AddressSpaceMapMerging(benchmark::State &state)
{
    size_t count = state.range(0);

    while (state.KeepRunning())
    {
        state.PauseTiming();
        Fixture fixture(count);
        state.ResumeTiming();

        for (size_t i = 0; i < count; ++i)
            fixture.map(BASE + i * PAGE, PAGE, ReadWrite);
    }

    state.SetItemsProcessed(int64_t(state.iterations()) * int64_t(count));
}

static void BM_AddressSpaceChangeProtection(benchmark::State &state)
{
    size_t count = state.range(0);
    Fixture fixture(count);
    fixture.map(BASE, count * PAGE, ReadWrite);

    size_t i = 0;
    while (state.KeepRunning())
    {
        VirtualRange range(BASE + (i % count) * PAGE, PAGE);
        fixture.addressSpace.changeProtection(range, AddressSpace::ChangeProtection::toProtection(Read));
        fixture.addressSpace.changeProtection(range, AddressSpace::ChangeProtection::toProtection(ReadWrite));
        ++i;
    }

    state.SetItemsProcessed(int64_t(state.iterations()) * 2);
}

static void BM_AddressSpaceFault(benchmark::State &state)
{
    size_t count = state.range(0);

    while (state.KeepRunning())
    {
        state.PauseTiming();
        Fixture fixture(count);
        fixture.map(BASE, count * PAGE, ReadWrite);
        state.ResumeTiming();

        for (size_t i = 0; i < count; ++i)
            fixture.addressSpace.handlePageFault(BASE + i * PAGE, AddressSpace::WriteAccess);
    }

    state.SetItemsProcessed(int64_t(state.iterations()) * int64_t(count));
}

BENCHMARK(BM_AddressSpaceMapDistinct)->Range(8, 1024);
BENCHMARK(BM_AddressSpaceMapMerging)->Range(8, 1024);
BENCHMARK(BM_AddressSpaceChangeProtection)->Range(8, 1024);
BENCHMARK(BM_AddressSpaceFault)->Range(8, 1024);
