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

#ifndef KERNEL_MEMORY_ANONYMOUSMAP_H
#define KERNEL_MEMORY_ANONYMOUSMAP_H

#include <processor/types.h>
#include <utilities/RwLock.h>
#include <memory/ChunkMap.h>
#include <memory/AnonymousPage.h>
#include <LockGuard.h>

class AddressSpace;
class AddressSpaceCaches;
class Entry;

/** @addtogroup kernelmemory
 * @{ */

/**
 * A reference-counted, sparse array of anonymous pages.
 *
 * One anonymous map backs the private memory of one or more entries. Each
 * entry sees a window of the map starting at its reference's start offset.
 * A missing slot is a page that has not been faulted in yet.
 */
class AnonymousMap
{
    public:
        typedef ChunkMap<AnonymousPage> PageChunkMap;

        /** How add() treats the slot. */
        enum AddOperation
        {
            /** The slot must be empty. */
            Add,
            /** The slot must hold a page, which the caller has taken over. */
            Replace
        };

        AnonymousMap();

        /** Creates an empty map of numberOfPages pages with one reference.
         *\return the map, or null if the anonymous map pool is exhausted */
        static AnonymousMap *create(AddressSpaceCaches &caches, size_t numberOfPages,
                                    size_t pageSize);

        static void incrementReferenceCount(WriteLockGuard<AnonymousMap> &guard);

        /** Drops a reference and releases the guard. The last reference drops
         *  every page in the map and frees the map. */
        static void decrementReferenceCount(WriteLockGuard<AnonymousMap> &guard,
                                            AddressSpaceCaches &caches);

        /**
         * Makes sure the entry has a private anonymous map, clearing its
         * needsCopy flag.
         *
         * An entry without a map gets a new, empty one. An entry whose map is
         * not shared keeps it. Otherwise the entry gets a new map holding a
         * reference to every page in its window of the old one.
         *
         * The entry's map must not be locked by the caller.
         *\return false if memory ran out; the entry is unchanged
         */
        static bool copy(WriteLockGuard<AddressSpace> &guard, Entry &entry);

        RwLock &getLock()
        {
            return m_Lock;
        }

        /** The caller must hold the lock for the following. */
        size_t getReferenceCount() const
        {
            return m_ReferenceCount;
        }

        size_t getNumberOfPages() const
        {
            return m_NumberOfPages;
        }

        size_t getPagesInUse() const
        {
            return m_PagesInUse;
        }

        size_t getPageSize() const
        {
            return m_PageSize;
        }

        /** Get the page at index, or null if it has not been populated. */
        AnonymousPage *lookup(size_t index) const
        {
            return m_Pages.get(index);
        }

        /**
         * Stores a page at index.
         *
         * For Add the slot must be empty and the map takes over the caller's
         * reference. For Replace the previous page is handed back through
         * pOldPage with the reference the map held on it.
         *\return false if a chunk could not be allocated
         */
        bool add(WriteLockGuard<AnonymousMap> &guard, size_t index, AnonymousPage *pPage,
                 AddOperation operation, AnonymousPage **pOldPage = 0);

        /** Extends the map to at least numberOfPages pages. */
        void grow(WriteLockGuard<AnonymousMap> &guard, size_t numberOfPages);

        /** Drops the map's reference on every page in [first, first + count)
         *  and empties those slots. */
        void releasePages(WriteLockGuard<AnonymousMap> &guard, size_t first, size_t count,
                          AddressSpaceCaches &caches);

        /** Logs the map at the given indent. Takes the lock for reading. */
        void print(size_t indent);

    private:
        NOT_COPYABLE_OR_ASSIGNABLE(AnonymousMap);

        /** Collects the indices of populated slots in [first, first + count). */
        void populatedIndices(size_t first, size_t count, Vector<size_t> &indices) const;

        RwLock m_Lock;
        size_t m_ReferenceCount;
        size_t m_NumberOfPages;
        size_t m_PagesInUse;
        size_t m_PageSize;
        PageChunkMap m_Pages;
};

/** @} */

#endif
