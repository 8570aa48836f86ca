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

#ifndef KERNEL_MEMORY_ENTRY_H
#define KERNEL_MEMORY_ENTRY_H

#include <processor/types.h>
#include <memory/MapType.h>
#include <memory/VirtualRange.h>

class AddressSpaceCaches;
class AnonymousMap;
class MemoryObject;

/** @addtogroup kernelmemory
 * @{ */

/**
 * One mapped range of an address space, with uniform protection and
 * backing.
 *
 * An entry refers to (but does not own) an anonymous map and/or a memory
 * object. Each non-null reference accounts for one reference count on the
 * store. Entries are plain values: the address space's entries lock guards
 * every field.
 */
class Entry
{
    public:
        /** A window into an anonymous map. */
        struct AnonymousMapReference
        {
            AnonymousMap *pMap;
            /** Byte offset of the entry's first page in the map. */
            size_t startOffset;
        };

        /** A window into a memory object. */
        struct ObjectReference
        {
            MemoryObject *pObject;
            /** Byte offset of the entry's first page in the object. */
            size_t startOffset;
        };

        enum ShrinkDirection
        {
            /** Drop pages from the start of the range. */
            FromStart,
            /** Drop pages from the end of the range. */
            FromEnd
        };

        Entry();

        static Entry *create(AddressSpaceCaches &caches);
        /** Allocates count entries, or none at all.
         *\return false if the pool could not supply them all */
        static bool createMany(AddressSpaceCaches &caches, Entry **pEntries, size_t count);
        /** Returns an entry to the pool. References are not touched. */
        static void destroy(AddressSpaceCaches &caches, Entry *pEntry);

        bool anyOverlap(const Entry &other) const
        {
            return range.anyOverlap(other.range);
        }

        /** Whether following (which must come after this entry) can be folded
         *  into this entry. */
        bool canMerge(const Entry &following) const;

        /** Folds following into this entry. following's references are taken
         *  over or dropped; it can then be destroyed without touching them. */
        void merge(Entry &following, AddressSpaceCaches &caches);

        /** Splits at offset bytes into the range. This entry keeps the lower
         *  part and newEntry becomes the upper part. Both parts hold a
         *  reference on each backing store. */
        void split(Entry &newEntry, size_t offset);

        /** Trims the range to newSize bytes.
         *\param[in] freePages whether anonymous pages in the trimmed part are
         *           released now; they are kept when the map may be shared */
        void shrink(ShrinkDirection direction, size_t newSize, bool freePages,
                    AddressSpaceCaches &caches);

        /** Drops the entry's references before it is destroyed.
         *\param[in] freePages as for shrink() */
        void dropReferences(bool freePages, AddressSpaceCaches &caches);

        /** Logs the entry at the given indent. */
        void print(size_t indent) const;

        VirtualRange range;
        Protection protection;
        Protection maxProtection;
        AnonymousMapReference anonymousMap;
        ObjectReference object;
        /** Writes go to anonymous memory instead of the object. */
        bool copyOnWrite;
        /** The entry owns a private anonymous map that has not been made
         *  yet; any map it references may be shared. */
        bool needsCopy;
        size_t wiredCount;

    private:
        /** Releases anonymous pages in the byte window [offset, offset + size)
         *  of the entry, if the entry's map is private to it. */
        void releaseWindow(size_t offset, size_t size, bool freePages,
                           AddressSpaceCaches &caches);
};

/** @} */

#endif
