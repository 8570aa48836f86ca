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

#ifndef KERNEL_MEMORY_MEMORYOBJECT_H
#define KERNEL_MEMORY_MEMORYOBJECT_H

#include <processor/types.h>
#include <processor/PhysicalMemoryManager.h>
#include <utilities/RwLock.h>
#include <memory/ChunkMap.h>
#include <LockGuard.h>

/** @addtogroup kernelmemory
 * @{ */

/** A page owned by a MemoryObject. */
struct PhysicalPage
{
    PhysicalPage() : address(0)
    {
    }

    physical_uintptr_t address;
};

/**
 * The backing store of file or device memory.
 *
 * Entries map windows of an object copy-on-write: reads see the object's
 * pages and the first write makes a private anonymous copy. Only pages that
 * are resident can be mapped; nothing here reads from a backing device, so
 * the owner populates the object with insertPage().
 *
 * Objects are reference counted. The creator holds the first reference and
 * every entry mapping the object holds one more.
 */
class MemoryObject
{
    public:
        typedef ChunkMap<PhysicalPage> PhysicalPageChunkMap;

        /** Creates an object with one reference.
         *\param[in] name used in log output
         *\param[in] physicalMemory where resident pages are freed to */
        MemoryObject(const char *name, PhysicalMemoryManager &physicalMemory);

        static void incrementReferenceCount(WriteLockGuard<MemoryObject> &guard);

        /** Drops a reference and releases the guard. The last reference frees
         *  the object and every resident page. */
        static void decrementReferenceCount(WriteLockGuard<MemoryObject> &guard);

        /** Makes page resident at the given page index. The object takes
         *  ownership of the physical page. Takes the lock for writing.
         *\return false if index is already resident or memory ran out */
        bool insertPage(size_t index, physical_uintptr_t page);

        RwLock &getLock()
        {
            return m_Lock;
        }

        /** The caller must hold the lock for the following. */
        size_t getReferenceCount() const
        {
            return m_ReferenceCount;
        }

        /** Get the resident page at index.
         *\return its physical address, or 0 if it is not resident */
        physical_uintptr_t lookupPage(size_t index) const
        {
            PhysicalPage *pPage = m_Pages.get(index);
            return pPage ? pPage->address : 0;
        }

        size_t getResidentPageCount() const
        {
            return m_nResident;
        }

        size_t getPageSize() const
        {
            return m_PhysicalMemory.getPageSize();
        }

        PhysicalMemoryManager &getPhysicalMemory() const
        {
            return m_PhysicalMemory;
        }

        const char *getName() const
        {
            return m_Name;
        }

        /** Logs the object at the given indent. Takes the lock for reading. */
        void print(size_t indent);

    private:
        NOT_COPYABLE_OR_ASSIGNABLE(MemoryObject);

        /** Only the last reference destroys the object. */
        ~MemoryObject();

        RwLock m_Lock;
        size_t m_ReferenceCount;
        size_t m_nResident;
        PhysicalMemoryManager &m_PhysicalMemory;
        StaticString<32> m_Name;

        PhysicalPageChunkMap::ChunkPool m_ChunkPool;
        PhysicalPageChunkMap m_Pages;
};

/** @} */

#endif
