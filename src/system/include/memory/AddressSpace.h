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

#ifndef KERNEL_MEMORY_ADDRESSSPACE_H
#define KERNEL_MEMORY_ADDRESSSPACE_H

#include <processor/types.h>
#include <processor/PageTable.h>
#include <process/Mutex.h>
#include <utilities/RwLock.h>
#include <utilities/StaticString.h>
#include <utilities/Vector.h>
#include <memory/config.h>
#include <memory/MapType.h>
#include <memory/VirtualRange.h>
#include <memory/Entry.h>
#include <LockGuard.h>

class AddressSpaceCaches;
class FaultInfo;
class MemoryObject;
class Process;

/** @addtogroup kernelmemory
 * @{ */

/** Result of AddressSpace::map. */
struct MapError
{
    enum Type
    {
        None = 0,
        /** The requested size is zero. */
        ZeroSize,
        /** The fixed range is taken, or no gap is large enough. */
        RequestedRangeUnavailable,
        OutOfMemory,
        /** The protection would exceed the maximum protection. */
        MaxProtectionExceeded
    };
};

/** Result of AddressSpace::changeProtection. */
struct ChangeProtectionError
{
    enum Type
    {
        None = 0,
        /** An entry's maximum protection would be raised. */
        MaxProtectionIncreased,
        /** An entry's protection would exceed its maximum protection. */
        MaxProtectionExceeded,
        OutOfMemory
    };
};

/** Result of AddressSpace::unmap. */
struct UnmapError
{
    enum Type
    {
        None = 0,
        /** Only possible when punching a hole in a single entry. */
        OutOfMemory
    };
};

/** Result of AddressSpace::handlePageFault. */
struct PageFaultError
{
    enum Type
    {
        None = 0,
        /** No entry covers the faulting address. */
        NotMapped,
        /** The access is not allowed by the entry's protection. */
        Protection,
        OutOfMemory
    };
};

const char *mapErrorName(MapError::Type error);
const char *changeProtectionErrorName(ChangeProtectionError::Type error);
const char *pageFaultErrorName(PageFaultError::Type error);

/**
 * A virtual address space: the sorted list of entries describing what is
 * mapped where, and the page table the entries are realised in.
 *
 * The entries lock guards the entry list and every entry's fields. The page
 * table lock serialises page table updates and is only taken after the
 * entries lock. Locks on anonymous maps, anonymous pages and objects are
 * only taken with the entries lock held.
 *
 * Ranges passed in should be aligned to the page size; unaligned ranges are
 * widened to page boundaries.
 */
class AddressSpace
{
    friend class FaultInfo;

    public:
        /** Kind of access that faulted. */
        enum AccessType
        {
            ReadAccess = 0,
            WriteAccess,
            ExecuteAccess
        };

        /** What AddressSpace::map should create. */
        struct MapOptions
        {
            MapOptions() :
                hasBase(false), base(0), size(0), protection(None),
                hasMaxProtection(false), maxProtection(None), pObject(0),
                objectOffset(0)
            {
            }

            /** Map at base instead of anywhere. */
            bool hasBase;
            uintptr_t base;
            size_t size;
            Protection protection;
            /** Defaults to protection when not given. Must not be None. */
            bool hasMaxProtection;
            Protection maxProtection;
            /** Backing object; null for zero-filled memory. The mapping takes
             *  its own reference on the object. */
            MemoryObject *pObject;
            /** Byte offset into the object of the first mapped page. */
            size_t objectOffset;
        };

        /** Which of protection and maximum protection to change. */
        struct ChangeProtection
        {
            static ChangeProtection toProtection(Protection protection)
            {
                ChangeProtection change = {true, protection, false, None};
                return change;
            }

            static ChangeProtection toMaxProtection(Protection maxProtection)
            {
                ChangeProtection change = {false, None, true, maxProtection};
                return change;
            }

            static ChangeProtection toBoth(Protection protection, Protection maxProtection)
            {
                ChangeProtection change = {true, protection, true, maxProtection};
                return change;
            }

            bool hasProtection;
            Protection protection;
            bool hasMaxProtection;
            Protection maxProtection;
        };

        /**
         * Creates an empty address space.
         *\param[in] name used in log output; user address spaces take the
         *           name of their process
         *\param[in] range the addresses entries may be placed at
         *\param[in] environment kernel, or user with its process
         *\param[in] pageTable where translations are written
         *\param[in] caches pools to allocate from
         */
        AddressSpace(const char *name, const VirtualRange &range, Environment environment,
                     PageTable &pageTable, AddressSpaceCaches &caches);
        ~AddressSpace();

        /**
         * Maps a range.
         *\param[in] options what to map, and where
         *\param[out] result the range that was mapped
         *\return MapError::None on success
         */
        MapError::Type map(const MapOptions &options, VirtualRange &result);

        /** Changes the protection and/or maximum protection of every mapped
         *  page in range. Nothing changes unless the whole request is valid. */
        ChangeProtectionError::Type changeProtection(const VirtualRange &range,
                                                     const ChangeProtection &change);

        /** Unmaps every mapped page in range. */
        UnmapError::Type unmap(const VirtualRange &range);

        /** Resolves a page fault at address. */
        PageFaultError::Type handlePageFault(uintptr_t address, AccessType access);

        /** Binds an empty user address space to a new process. */
        void retarget(Process *pProcess);

        /** Unmaps everything and resets the address space for reuse. */
        void reinitializeAndUnmapAll();

        /** Checks the address space is empty before it goes away. */
        void deinit();

        /** Logs every entry. Takes the entries lock for reading. */
        void print();

        /** The entries lock, through which ReadLockGuard<AddressSpace> and
         *  WriteLockGuard<AddressSpace> lock the address space. */
        RwLock &getLock()
        {
            return m_EntriesLock;
        }

        const char *getName() const
        {
            return m_Name;
        }

        const VirtualRange &getRange() const
        {
            return m_Range;
        }

        Environment getEnvironment() const
        {
            return m_Environment;
        }

        PageTable &getPageTable() const
        {
            return m_PageTable;
        }

        AddressSpaceCaches &getCaches() const
        {
            return m_Caches;
        }

        size_t getPageSize() const
        {
            return m_PageTable.getPageSize();
        }

        /** The caller must hold the entries lock for the following. */
        uint32_t getEntriesVersion() const
        {
            return m_EntriesVersion;
        }

        size_t getEntryCount() const
        {
            return m_Entries.count();
        }

        const Entry &getEntry(size_t index) const
        {
            return *m_Entries[index];
        }

        /** Index of the entry containing address.
         *\return false if no entry contains it */
        bool entryIndexByAddress(uintptr_t address, size_t &index) const;

        /** Total size of all entries. */
        size_t getMappedSize() const;

    private:
        NOT_COPYABLE_OR_ASSIGNABLE(AddressSpace);

        /** A gap found for a new entry. */
        struct FreeRange
        {
            VirtualRange range;
            size_t insertionIndex;
        };

        /** The entries overlapping a range. */
        struct EntryRange
        {
            EntryRange() : start(0), length(0), startOverlap(false), endOverlap(false)
            {
            }

            bool isWithinSingleEntry() const
            {
                return length == 1 && startOverlap && endOverlap;
            }

            size_t start;
            size_t length;
            /** The first entry starts before the range. */
            bool startOverlap;
            /** The last entry ends after the range. */
            bool endOverlap;
        };

        struct ValidateChangeProtection
        {
            bool noOp;
            bool updatePageTable;
        };

        struct ChangeProtectionResult
        {
            ChangeProtectionResult() : entriesSplit(0), entriesModified(0), entriesMerged(0)
            {
            }

            size_t entriesSplit;
            size_t entriesModified;
            size_t entriesMerged;
        };

        /** Entries allocated up front so a mutation cannot fail part way. */
        class PreallocatedEntries
        {
            public:
                PreallocatedEntries(AddressSpaceCaches &caches) :
                    m_Caches(caches), m_Count(0)
                {
                }
                /** Frees whatever was not used. */
                ~PreallocatedEntries();

                bool preallocate(size_t count);
                Entry *pop();

            private:
                NOT_COPYABLE_OR_ASSIGNABLE(PreallocatedEntries);

                AddressSpaceCaches &m_Caches;
                Entry *m_pEntries[2];
                size_t m_Count;
        };

        /** Widens range to page boundaries, warning if that was needed.
         *\return false for an empty range or one whose end would wrap */
        bool alignRange(const VirtualRange &range, const char *operation,
                        VirtualRange &result) const;

        /** Cuts range down to this address space, then aligns it. A range
         *  that runs past the top of memory is treated as reaching it.
         *\return false if nothing of range lies inside the address space */
        bool clampRange(const VirtualRange &range, const char *operation,
                        VirtualRange &result) const;

        /** First entry whose last address is at or after address. */
        size_t lowerBound(uintptr_t address) const;

        bool findExactFreeRange(const VirtualRange &range, FreeRange &result) const;
        bool findFreeRange(size_t size, FreeRange &result) const;
        bool entryRange(const VirtualRange &range, EntryRange &result) const;

        ChangeProtectionError::Type validateChangeProtection(const EntryRange &entryRange,
                                                             const ChangeProtection &change,
                                                             ValidateChangeProtection &result) const;
        ChangeProtectionResult performChangeProtection(const EntryRange &entryRange,
                                                       const VirtualRange &range,
                                                       const ChangeProtection &change,
                                                       PreallocatedEntries &preallocated);
        /** Pushes a protection change for range into the page table. */
        void changePageTableProtection(const EntryRange &entryRange, const VirtualRange &range,
                                       Protection protection);

        StaticString<ADDRESS_SPACE_NAME_LENGTH> m_Name;
        VirtualRange m_Range;
        Environment m_Environment;

        PageTable &m_PageTable;
        /** Protects m_PageTable. */
        Mutex m_PageTableLock;

        /** Sorted by address, never overlapping. */
        Vector<Entry *> m_Entries;
        /** Protects m_Entries and every entry's fields. */
        RwLock m_EntriesLock;

        /** Incremented, wrapping, whenever the entries change. */
        uint32_t m_EntriesVersion;

        AddressSpaceCaches &m_Caches;
};

/** @} */

#endif
