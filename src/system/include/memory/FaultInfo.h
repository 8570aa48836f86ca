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

#ifndef KERNEL_MEMORY_FAULTINFO_H
#define KERNEL_MEMORY_FAULTINFO_H

#include <processor/types.h>
#include <memory/AddressSpace.h>

class AnonymousMap;
class AnonymousPage;

/** @addtogroup kernelmemory
 * @{ */

/** Outcome of one pass over a page fault. */
struct FaultAttempt
{
    enum Type
    {
        /** The fault is resolved, or failed with error. */
        Done,
        /** Locks had to be dropped; look the address up again. */
        Restart
    };

    static FaultAttempt done(PageFaultError::Type error)
    {
        FaultAttempt attempt = {Done, error};
        return attempt;
    }

    static FaultAttempt restart()
    {
        FaultAttempt attempt = {Restart, PageFaultError::None};
        return attempt;
    }

    Type type;
    PageFaultError::Type error;
};

/**
 * State of a page fault being resolved.
 *
 * Each attempt() looks the address up under the entries read lock and walks
 * the layers in order: the entry's anonymous map, then its object or a zero
 * page. Whenever a lock has to be taken in another order the attempt gives
 * up with Restart, keeping whatever it learned for the next pass.
 */
class FaultInfo
{
    public:
        FaultInfo(AddressSpace &addressSpace, uintptr_t address,
                  AddressSpace::AccessType access) :
            m_AddressSpace(addressSpace), m_Address(address), m_Access(access),
            m_bMapWriteLock(false), m_EntryIndex(0), m_EntriesVersion(0)
        {
        }

        FaultAttempt attempt();

        /** Whether protection permits access. */
        static bool accessAllowed(Protection protection, AddressSpace::AccessType access);

        /** The access that exercises all of protection. */
        static AddressSpace::AccessType widestAccess(Protection protection);

    private:
        NOT_COPYABLE_OR_ASSIGNABLE(FaultInfo);

        /** Materialises the entry's private anonymous map. */
        FaultAttempt copyAnonymousMap();

        /** Resolves the fault with the entry's anonymous map write-locked. */
        FaultAttempt resolveLocked(Entry &entry, WriteLockGuard<AnonymousMap> &mapGuard,
                                   Protection enterProtection);

        /** Resolves a read or execute fault with the map read-locked, or
         *  restarts if the map turns out to need changing. */
        FaultAttempt resolveShared(Entry &entry, ReadLockGuard<AnonymousMap> &mapGuard,
                                   Protection enterProtection);

        /** Puts a new page at index, copied from source or zeroed when
         *  source is 0, replacing pOld if given, and maps it. */
        FaultAttempt promote(WriteLockGuard<AnonymousMap> &mapGuard, size_t index,
                             physical_uintptr_t source, AnonymousPage *pOld,
                             Protection enterProtection);

        /** Maps an object page, read-only while the entry is copy-on-write. */
        FaultAttempt installObjectPage(const Entry &entry, Protection enterProtection);

        FaultAttempt install(physical_uintptr_t page, Protection protection);

        /** The object page backing the faulting address, or 0 if it is not
         *  resident. */
        physical_uintptr_t objectPage(const Entry &entry) const;

        size_t mapIndex(const Entry &entry) const;

        AddressSpace &m_AddressSpace;
        uintptr_t m_Address;
        AddressSpace::AccessType m_Access;

        /** Take the anonymous map's lock for writing from the start. Set when
         *  an upgrade has failed once. */
        bool m_bMapWriteLock;

        /** Where the entry was, and the entries version it was seen at,
         *  when the read lock was dropped to copy its map. */
        size_t m_EntryIndex;
        uint32_t m_EntriesVersion;
};

/** @} */

#endif
