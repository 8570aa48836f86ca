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

#ifndef KERNEL_MEMORY_ADDRESSSPACECACHES_H
#define KERNEL_MEMORY_ADDRESSSPACECACHES_H

#include <processor/PhysicalMemoryManager.h>
#include <utilities/ObjectPool.h>
#include <memory/Entry.h>
#include <memory/AnonymousMap.h>
#include <memory/AnonymousPage.h>

/** @addtogroup kernelmemory
 * @{ */

/**
 * Everything the memory manager allocates from: the pools for entries,
 * anonymous maps, anonymous pages and their chunks, plus the physical memory
 * manager.
 *
 * One instance is shared by any number of address spaces. A limit of zero
 * leaves a pool unbounded.
 */
class AddressSpaceCaches
{
    public:
        struct Limits
        {
            Limits() : entries(0), anonymousMaps(0), anonymousPages(0), chunks(0)
            {
            }

            size_t entries;
            size_t anonymousMaps;
            size_t anonymousPages;
            size_t chunks;
        };

        explicit AddressSpaceCaches(PhysicalMemoryManager &physicalMemory,
                                    const Limits &limits = Limits()) :
            entries(limits.entries), anonymousMaps(limits.anonymousMaps),
            anonymousPages(limits.anonymousPages), anonymousPageChunks(limits.chunks),
            physicalMemory(physicalMemory)
        {
        }

        ObjectPool<Entry> entries;
        ObjectPool<AnonymousMap> anonymousMaps;
        ObjectPool<AnonymousPage> anonymousPages;
        AnonymousMap::PageChunkMap::ChunkPool anonymousPageChunks;

        PhysicalMemoryManager &physicalMemory;

    private:
        NOT_COPYABLE_OR_ASSIGNABLE(AddressSpaceCaches);
};

/** @} */

#endif
