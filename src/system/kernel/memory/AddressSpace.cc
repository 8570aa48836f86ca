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

#include <memory/AddressSpace.h>
#include <memory/AddressSpaceCaches.h>
#include <memory/AnonymousMap.h>
#include <memory/FaultInfo.h>
#include <memory/MemoryObject.h>
#include <process/Process.h>
#include <Log.h>

const char *mapErrorName(MapError::Type error)
{
    switch (error)
    {
        case MapError::None:
            return "None";
        case MapError::ZeroSize:
            return "ZeroSize";
        case MapError::RequestedRangeUnavailable:
            return "RequestedRangeUnavailable";
        case MapError::OutOfMemory:
            return "OutOfMemory";
        case MapError::MaxProtectionExceeded:
            return "MaxProtectionExceeded";
    }
    return "Unknown";
}

const char *changeProtectionErrorName(ChangeProtectionError::Type error)
{
    switch (error)
    {
        case ChangeProtectionError::None:
            return "None";
        case ChangeProtectionError::MaxProtectionIncreased:
            return "MaxProtectionIncreased";
        case ChangeProtectionError::MaxProtectionExceeded:
            return "MaxProtectionExceeded";
        case ChangeProtectionError::OutOfMemory:
            return "OutOfMemory";
    }
    return "Unknown";
}

const char *pageFaultErrorName(PageFaultError::Type error)
{
    switch (error)
    {
        case PageFaultError::None:
            return "None";
        case PageFaultError::NotMapped:
            return "NotMapped";
        case PageFaultError::Protection:
            return "Protection";
        case PageFaultError::OutOfMemory:
            return "OutOfMemory";
    }
    return "Unknown";
}

AddressSpace::AddressSpace(const char *name, const VirtualRange &range, Environment environment,
                           PageTable &pageTable, AddressSpaceCaches &caches) :
    m_Name(name), m_Range(range), m_Environment(environment), m_PageTable(pageTable),
    m_PageTableLock(), m_Entries(), m_EntriesLock(), m_EntriesVersion(0), m_Caches(caches)
{
    size_t pageSize = pageTable.getPageSize();
    if ((range.address & (pageSize - 1)) || (range.size & (pageSize - 1)) || !range.size)
        FATAL("AddressSpace '" << name << "': range " << Hex << range.address << " + "
              << range.size << " is not page aligned");
}

AddressSpace::~AddressSpace()
{
    if (!m_Entries.count())
        return;

    WARNING("AddressSpace '" << m_Name << "': destroyed with " << m_Entries.count()
            << " entries still mapped");

    UnmapError::Type error = unmap(m_Range);
    if (error != UnmapError::None)
        ERROR("AddressSpace '" << m_Name << "': unable to unmap everything on destruction");
}

MapError::Type AddressSpace::map(const MapOptions &options, VirtualRange &result)
{
    if (!options.size)
        return MapError::ZeroSize;

    Protection maxProtection = options.protection;
    if (options.hasMaxProtection)
    {
        if (options.maxProtection == None || options.protection > options.maxProtection)
            return MapError::MaxProtectionExceeded;
        maxProtection = options.maxProtection;
    }

    // Sizes that cannot fit, or that would wrap once rounded to pages.
    VirtualRange request;
    if (options.size > m_Range.size ||
        !alignRange(VirtualRange(options.hasBase ? options.base : 0, options.size), "map",
                    request))
        return MapError::RequestedRangeUnavailable;

    size_t pageSize = getPageSize();
    size_t objectOffset = options.objectOffset;
    if (objectOffset & (pageSize - 1))
    {
        WARNING("AddressSpace '" << m_Name << "': map: object offset " << Hex << objectOffset
                << " rounded down to a page boundary");
        objectOffset &= ~(pageSize - 1);
    }

    Entry local;
    local.protection = options.protection;
    local.maxProtection = maxProtection;
    local.copyOnWrite = true;
    local.needsCopy = true;
    local.object.pObject = options.pObject;
    local.object.startOffset = objectOffset;

    WriteLockGuard<AddressSpace> guard(*this);

    FreeRange freeRange;
    bool bFound = options.hasBase ? findExactFreeRange(request, freeRange)
                                  : findFreeRange(request.size, freeRange);
    if (!bFound)
    {
        DEBUG_LOG("AddressSpace '" << m_Name << "': no room for " << Hex << request.size
                  << " bytes");
        return MapError::RequestedRangeUnavailable;
    }

    local.range = freeRange.range;
    size_t index = freeRange.insertionIndex;

    Entry *pFollowing = index < m_Entries.count() ? m_Entries[index] : 0;
    Entry *pPreceding = index ? m_Entries[index - 1] : 0;

    // Decide how the mapping lands before touching anything, so the only
    // failure leaves the address space and the object as they were.
    bool bMergedFollowing = pFollowing && local.canMerge(*pFollowing);
    bool bMergedPreceding = !bMergedFollowing && pPreceding && pPreceding->canMerge(local);

    Entry *pEntry = 0;
    if (!bMergedFollowing && !bMergedPreceding)
    {
        pEntry = Entry::create(m_Caches);
        if (!pEntry)
            return MapError::OutOfMemory;
    }

    // The reference belongs to the new range; a merge below drops it again
    // when a neighbour already holds one.
    if (options.pObject)
    {
        WriteLockGuard<MemoryObject> objectGuard(*options.pObject);
        MemoryObject::incrementReferenceCount(objectGuard);
    }

    if (bMergedFollowing)
    {
        local.merge(*pFollowing, m_Caches);
        *pFollowing = local;

        if (pPreceding && pPreceding->canMerge(*pFollowing))
        {
            pPreceding->merge(*pFollowing, m_Caches);
            m_Entries.remove(index);
            Entry::destroy(m_Caches, pFollowing);
            bMergedPreceding = true;
        }
    }
    else if (bMergedPreceding)
    {
        pPreceding->merge(local, m_Caches);
    }
    else
    {
        *pEntry = local;
        m_Entries.insert(index, pEntry);
    }

    ++m_EntriesVersion;

#ifdef DEBUG_ADDRESS_SPACE
    NOTICE("AddressSpace '" << m_Name << "': mapped [" << Hex << freeRange.range.address << ", "
           << freeRange.range.endBound() << ") " << protectionName(options.protection)
           << (bMergedFollowing ? " merged following" : "")
           << (bMergedPreceding ? " merged preceding" : ""));
#endif

    result = freeRange.range;
    return MapError::None;
}

ChangeProtectionError::Type AddressSpace::changeProtection(const VirtualRange &range,
                                                           const ChangeProtection &change)
{
    if (change.hasMaxProtection && change.maxProtection == None)
        return ChangeProtectionError::MaxProtectionExceeded;

    VirtualRange request;
    if (!clampRange(range, "changeProtection", request))
        return ChangeProtectionError::None;

    ChangeProtectionResult result;
    {
        WriteLockGuard<AddressSpace> guard(*this);

        EntryRange entries;
        if (!entryRange(request, entries))
            return ChangeProtectionError::None;

        ValidateChangeProtection validate;
        ChangeProtectionError::Type error = validateChangeProtection(entries, change, validate);
        if (error != ChangeProtectionError::None)
        {
            DEBUG_LOG("AddressSpace '" << m_Name << "': change protection failed: "
                      << changeProtectionErrorName(error));
            return error;
        }

        if (validate.noOp)
            return ChangeProtectionError::None;

        PreallocatedEntries preallocated(m_Caches);
        if (!preallocated.preallocate((entries.startOverlap ? 1 : 0) + (entries.endOverlap ? 1 : 0)))
            return ChangeProtectionError::OutOfMemory;

        if (validate.updatePageTable)
        {
            LockGuard<Mutex> pageTableGuard(m_PageTableLock);
            changePageTableProtection(entries, request, change.protection);
        }

        ++m_EntriesVersion;

        result = performChangeProtection(entries, request, change, preallocated);
    }

#ifdef DEBUG_ADDRESS_SPACE
    NOTICE("AddressSpace '" << m_Name << "': change protection of [" << Hex << request.address
           << ", " << request.endBound() << ") resulted in " << Dec << result.entriesSplit
           << " split, " << result.entriesModified << " modified and " << result.entriesMerged
           << " merged entries");
#else
    DEBUG_LOG("AddressSpace '" << m_Name << "': change protection: " << result.entriesSplit
              << " split, " << result.entriesModified << " modified, " << result.entriesMerged
              << " merged");
#endif

    return ChangeProtectionError::None;
}

ChangeProtectionError::Type AddressSpace::validateChangeProtection(const EntryRange &entryRange,
                                                                   const ChangeProtection &change,
                                                                   ValidateChangeProtection &result) const
{
    result.noOp = true;
    result.updatePageTable = false;

    for (size_t i = entryRange.start; i < entryRange.start + entryRange.length; ++i)
    {
        const Entry *pEntry = m_Entries[i];

        Protection plannedMax = pEntry->maxProtection;
        if (change.hasMaxProtection)
        {
            if (change.maxProtection > pEntry->maxProtection)
                return ChangeProtectionError::MaxProtectionIncreased;

            if (change.maxProtection != pEntry->maxProtection)
                result.noOp = false;

            plannedMax = change.maxProtection;
        }

        if (change.hasProtection)
        {
            if (change.protection > plannedMax)
                return ChangeProtectionError::MaxProtectionExceeded;

            if (change.protection != pEntry->protection)
            {
                result.noOp = false;
                result.updatePageTable = true;
            }
        }
        else if (pEntry->protection > plannedMax)
        {
            return ChangeProtectionError::MaxProtectionExceeded;
        }
    }

    return ChangeProtectionError::None;
}

void AddressSpace::changePageTableProtection(const EntryRange &entryRange,
                                             const VirtualRange &range, Protection protection)
{
    for (size_t i = entryRange.start; i < entryRange.start + entryRange.length; ++i)
    {
        const Entry *pEntry = m_Entries[i];

        uintptr_t start = pEntry->range.address > range.address ? pEntry->range.address
                                                                : range.address;
        uintptr_t end = pEntry->range.endBound() < range.endBound() ? pEntry->range.endBound()
                                                                     : range.endBound();
        VirtualRange piece(start, end - start);

        if (protection == None)
        {
            m_PageTable.unmap(piece);
            continue;
        }

        // Copy-on-write pages stay read-only; the next write fault grants
        // write access once the page is private.
        Protection effective = protection;
        if (pEntry->copyOnWrite && protection == ReadWrite)
            effective = Read;

        m_PageTable.changeProtection(piece, MapType(m_Environment, effective));
    }
}

AddressSpace::ChangeProtectionResult AddressSpace::performChangeProtection(
    const EntryRange &entryRange, const VirtualRange &range, const ChangeProtection &change,
    PreallocatedEntries &preallocated)
{
    ChangeProtectionResult result;

    size_t first = entryRange.start;

    if (entryRange.startOverlap)
    {
        Entry *pFirst = m_Entries[first];
        bool bDiffers = (change.hasProtection && pFirst->protection != change.protection) ||
                        (change.hasMaxProtection && pFirst->maxProtection != change.maxProtection);
        if (bDiffers)
        {
            // | first | -> | first | new |, and new is now the first entry
            // of the range.
            Entry *pNew = preallocated.pop();
            pFirst->split(*pNew, range.address - pFirst->range.address);
            ++first;
            m_Entries.insert(first, pNew);
            ++result.entriesSplit;
        }
    }

    if (entryRange.endOverlap)
    {
        size_t lastIndex = first + entryRange.length - 1;
        Entry *pLast = m_Entries[lastIndex];
        bool bDiffers = (change.hasProtection && pLast->protection != change.protection) ||
                        (change.hasMaxProtection && pLast->maxProtection != change.maxProtection);
        if (bDiffers)
        {
            Entry *pNew = preallocated.pop();
            pLast->split(*pNew, range.endBound() - pLast->range.address);
            m_Entries.insert(lastIndex + 1, pNew);
            ++result.entriesSplit;
        }
    }

    size_t index = first + entryRange.length;
    while (index > first)
    {
        --index;

        Entry *pEntry = m_Entries[index];
        bool bModified = false;

        if (change.hasProtection && pEntry->protection != change.protection)
        {
            pEntry->protection = change.protection;
            bModified = true;
        }
        if (change.hasMaxProtection && pEntry->maxProtection != change.maxProtection)
        {
            pEntry->maxProtection = change.maxProtection;
            bModified = true;
        }

        bool bMerged = false;
        if (index + 1 < m_Entries.count())
        {
            Entry *pFollowing = m_Entries[index + 1];
            if (pEntry->canMerge(*pFollowing))
            {
                pEntry->merge(*pFollowing, m_Caches);
                m_Entries.remove(index + 1);
                Entry::destroy(m_Caches, pFollowing);
                bMerged = true;
            }
        }

        if (bMerged)
            ++result.entriesMerged;
        else if (bModified)
            ++result.entriesModified;
    }

    // A split first entry cannot merge with what precedes it.
    if (!entryRange.startOverlap && index)
    {
        Entry *pFirst = m_Entries[index];
        Entry *pPreceding = m_Entries[index - 1];

        if (pPreceding->canMerge(*pFirst))
        {
            pPreceding->merge(*pFirst, m_Caches);
            m_Entries.remove(index);
            Entry::destroy(m_Caches, pFirst);

            if (result.entriesModified)
                --result.entriesModified;
            ++result.entriesMerged;
        }
    }

    return result;
}

UnmapError::Type AddressSpace::unmap(const VirtualRange &range)
{
    VirtualRange request;
    if (!clampRange(range, "unmap", request))
        return UnmapError::None;

    WriteLockGuard<AddressSpace> guard(*this);

    EntryRange entries;
    if (!entryRange(request, entries))
        return UnmapError::None;

    PreallocatedEntries preallocated(m_Caches);
    if (entries.isWithinSingleEntry() && !preallocated.preallocate(1))
        return UnmapError::OutOfMemory;

    {
        LockGuard<Mutex> pageTableGuard(m_PageTableLock);
        m_PageTable.unmap(request);
    }

    // Kernel address spaces keep anonymous pages until the map itself goes.
    bool bFreePages = m_Environment.isUser();

    if (entries.isWithinSingleEntry())
    {
        // | entry | -> | entry | hole | upper |
        Entry *pEntry = m_Entries[entries.start];
        Entry *pUpper = preallocated.pop();

        pEntry->split(*pUpper, request.endBound() - pEntry->range.address);
        pEntry->shrink(Entry::FromEnd, request.address - pEntry->range.address, bFreePages,
                       m_Caches);
        m_Entries.insert(entries.start + 1, pUpper);
    }
    else
    {
        size_t first = entries.start;
        size_t end = entries.start + entries.length;

        if (entries.startOverlap)
        {
            Entry *pEntry = m_Entries[first];
            pEntry->shrink(Entry::FromEnd, request.address - pEntry->range.address, bFreePages,
                           m_Caches);
            ++first;
        }

        if (entries.endOverlap && end > first)
        {
            Entry *pEntry = m_Entries[end - 1];
            pEntry->shrink(Entry::FromStart, pEntry->range.endBound() - request.endBound(),
                           bFreePages, m_Caches);
            --end;
        }

        while (end > first)
        {
            --end;
            Entry *pEntry = m_Entries.remove(end);
            pEntry->dropReferences(bFreePages, m_Caches);
            Entry::destroy(m_Caches, pEntry);
        }
    }

    ++m_EntriesVersion;

#ifdef DEBUG_ADDRESS_SPACE
    NOTICE("AddressSpace '" << m_Name << "': unmapped [" << Hex << request.address << ", "
           << request.endBound() << ")");
#endif

    return UnmapError::None;
}

PageFaultError::Type AddressSpace::handlePageFault(uintptr_t address, AccessType access)
{
    uintptr_t aligned = address & ~(getPageSize() - 1);

    FaultInfo info(*this, aligned, access);
    for (size_t attempt = 0; attempt < FAULT_RESTART_LIMIT; ++attempt)
    {
        FaultAttempt result = info.attempt();
        if (result.type == FaultAttempt::Done)
        {
            if (result.error != PageFaultError::None)
                DEBUG_LOG("AddressSpace '" << m_Name << "': fault at " << Hex << address
                          << " failed: " << pageFaultErrorName(result.error));
            return result.error;
        }
    }

    FATAL("AddressSpace '" << m_Name << "': fault at " << Hex << address << " restarted "
          << Dec << FAULT_RESTART_LIMIT << " times");
    return PageFaultError::OutOfMemory;
}

void AddressSpace::retarget(Process *pProcess)
{
    WriteLockGuard<AddressSpace> guard(*this);

    if (!m_Environment.isUser())
        FATAL("AddressSpace '" << m_Name << "': only user address spaces can be retargeted");
    if (m_Entries.count() || m_EntriesVersion)
        FATAL("AddressSpace '" << m_Name << "': retargeted while in use");

    m_Name = pProcess->getName();
    m_Environment = Environment::user(pProcess);
}

void AddressSpace::reinitializeAndUnmapAll()
{
    UnmapError::Type error = unmap(m_Range);
    if (error != UnmapError::None)
        FATAL("AddressSpace '" << m_Name << "': unmapping everything failed");

    WriteLockGuard<AddressSpace> guard(*this);
    m_EntriesVersion = 0;
}

void AddressSpace::deinit()
{
    ReadLockGuard<AddressSpace> guard(*this);

    if (m_Entries.count())
        FATAL("AddressSpace '" << m_Name << "': deinit with " << m_Entries.count()
              << " entries still mapped");
}

void AddressSpace::print()
{
    ReadLockGuard<AddressSpace> guard(*this);

    NOTICE("AddressSpace{ name: " << m_Name << ", range: [" << Hex << m_Range.address << ", "
           << m_Range.endBound() << "), environment: "
           << (m_Environment.isUser() ? "user" : "kernel") << ", entries: " << Dec
           << m_Entries.count() << ", version: " << m_EntriesVersion << " }");

    for (Vector<Entry *>::ConstIterator it = m_Entries.begin(); it != m_Entries.end(); ++it)
        (*it)->print(2);
}

bool AddressSpace::entryIndexByAddress(uintptr_t address, size_t &index) const
{
    size_t i = lowerBound(address);
    if (i >= m_Entries.count() || !m_Entries[i]->range.containsAddress(address))
        return false;

    index = i;
    return true;
}

size_t AddressSpace::getMappedSize() const
{
    size_t total = 0;
    for (Vector<Entry *>::ConstIterator it = m_Entries.begin(); it != m_Entries.end(); ++it)
        total += (*it)->range.size;
    return total;
}

bool AddressSpace::alignRange(const VirtualRange &range, const char *operation,
                              VirtualRange &result) const
{
    if (!range.size || range.wraps())
        return false;

    size_t pageSize = getPageSize();
    uintptr_t start = range.address & ~(pageSize - 1);
    uintptr_t lastPage = range.last() & ~(pageSize - 1);

    // Rounding the end up must not carry past the top of the address space.
    size_t size = (lastPage - start) + pageSize;
    if (!size)
        return false;

    if (start != range.address || size != range.size)
        WARNING("AddressSpace '" << m_Name << "': " << operation << " of unaligned range "
                << Hex << range.address << " + " << range.size << " widened to page boundaries");

    result = VirtualRange(start, size);
    return true;
}

bool AddressSpace::clampRange(const VirtualRange &range, const char *operation,
                              VirtualRange &result) const
{
    if (!range.size)
        return false;

    // A range running off the top of memory covers everything above its base.
    uintptr_t last = range.wraps() ? ~static_cast<uintptr_t>(0) : range.last();

    uintptr_t start = range.address > m_Range.address ? range.address : m_Range.address;
    if (last > m_Range.last())
        last = m_Range.last();
    if (start > last)
        return false;

    return alignRange(VirtualRange(start, last - start + 1), operation, result);
}

size_t AddressSpace::lowerBound(uintptr_t address) const
{
    size_t low = 0;
    size_t high = m_Entries.count();

    while (low < high)
    {
        size_t mid = low + (high - low) / 2;
        if (m_Entries[mid]->range.last() < address)
            low = mid + 1;
        else
            high = mid;
    }

    return low;
}

bool AddressSpace::findExactFreeRange(const VirtualRange &range, FreeRange &result) const
{
    if (range.last() < range.address || !m_Range.fullyContains(range))
        return false;

    size_t index = lowerBound(range.address);
    if (index < m_Entries.count() && m_Entries[index]->range.address <= range.last())
        return false;

    result.range = range;
    result.insertionIndex = index;
    return true;
}

bool AddressSpace::findFreeRange(size_t size, FreeRange &result) const
{
    uintptr_t candidate = m_Range.address;

    for (size_t i = 0; i < m_Entries.count(); ++i)
    {
        const VirtualRange &entry = m_Entries[i]->range;
        if (entry.address >= candidate && entry.address - candidate >= size)
        {
            result.range = VirtualRange(candidate, size);
            result.insertionIndex = i;
            return true;
        }

        if (entry.endBound() > candidate)
            candidate = entry.endBound();
    }

    if (candidate > m_Range.last() || m_Range.last() - candidate < size - 1)
        return false;

    result.range = VirtualRange(candidate, size);
    result.insertionIndex = m_Entries.count();
    return true;
}

bool AddressSpace::entryRange(const VirtualRange &range, EntryRange &result) const
{
    size_t start = lowerBound(range.address);
    if (start >= m_Entries.count() || m_Entries[start]->range.address > range.last())
        return false;

    size_t end = start;
    while (end < m_Entries.count() && m_Entries[end]->range.address <= range.last())
        ++end;

    result.start = start;
    result.length = end - start;
    result.startOverlap = m_Entries[start]->range.address < range.address;
    result.endOverlap = m_Entries[end - 1]->range.last() > range.last();
    return true;
}

AddressSpace::PreallocatedEntries::~PreallocatedEntries()
{
    while (m_Count)
        Entry::destroy(m_Caches, m_pEntries[--m_Count]);
}

bool AddressSpace::PreallocatedEntries::preallocate(size_t count)
{
    if (m_Count + count > 2)
        FATAL("PreallocatedEntries: at most two entries can be reserved");

    if (!count)
        return true;

    if (!Entry::createMany(m_Caches, &m_pEntries[m_Count], count))
        return false;

    m_Count += count;
    return true;
}

Entry *AddressSpace::PreallocatedEntries::pop()
{
    if (!m_Count)
        FATAL("PreallocatedEntries: pop with nothing reserved");

    return m_pEntries[--m_Count];
}
