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

#ifndef KERNEL_MEMORY_ANONYMOUSPAGE_H
#define KERNEL_MEMORY_ANONYMOUSPAGE_H

#include <processor/types.h>
#include <utilities/RwLock.h>
#include <LockGuard.h>

class AddressSpaceCaches;

/** @addtogroup kernelmemory
 * @{ */

/**
 * A reference-counted handle to one physical page of anonymous memory.
 *
 * Anonymous pages are shared between anonymous maps only for copy-on-write:
 * a page may only be written through a map when its reference count is one.
 * The handle owns its physical page and frees it with the last reference.
 */
class AnonymousPage
{
    public:
        AnonymousPage();

        /** Wraps a physical page in a new handle with one reference.
         *\return the handle, or null if the anonymous page pool is exhausted */
        static AnonymousPage *create(AddressSpaceCaches &caches, physical_uintptr_t page);

        /** Adds a reference. */
        static void incrementReferenceCount(WriteLockGuard<AnonymousPage> &guard);

        /** Drops a reference and releases the guard. The last reference frees
         *  the physical page and the handle. */
        static void decrementReferenceCount(WriteLockGuard<AnonymousPage> &guard,
                                            AddressSpaceCaches &caches);

        RwLock &getLock()
        {
            return m_Lock;
        }

        /** The caller must hold the lock. */
        size_t getReferenceCount() const
        {
            return m_ReferenceCount;
        }

        physical_uintptr_t getPhysicalPage() const
        {
            return m_PhysicalPage;
        }

    private:
        NOT_COPYABLE_OR_ASSIGNABLE(AnonymousPage);

        RwLock m_Lock;
        size_t m_ReferenceCount;
        physical_uintptr_t m_PhysicalPage;
};

/** @} */

#endif
