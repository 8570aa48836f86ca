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

#include <memory/FaultInfo.h>
#include <memory/AddressSpaceCaches.h>
#include <memory/AnonymousMap.h>
#include <memory/AnonymousPage.h>
#include <memory/MemoryObject.h>
#include <Log.h>

#include <string.h>

bool FaultInfo::accessAllowed(Protection protection, AddressSpace::AccessType access)
{
    switch (protection)
    {
        case None:
            return false;
        case Read:
            return access == AddressSpace::ReadAccess;
        case ReadWrite:
            return access == AddressSpace::ReadAccess || access == AddressSpace::WriteAccess;
        case Execute:
            return access == AddressSpace::ExecuteAccess;
    }
    return false;
}

AddressSpace::AccessType FaultInfo::widestAccess(Protection protection)
{
    switch (protection)
    {
        case ReadWrite:
            return AddressSpace::WriteAccess;
        case Execute:
            return AddressSpace::ExecuteAccess;
        default:
            return AddressSpace::ReadAccess;
    }
}

FaultAttempt FaultInfo::attempt()
{
    ReadLockGuard<AddressSpace> guard(m_AddressSpace);

    size_t index;
    if (!m_AddressSpace.entryIndexByAddress(m_Address, index))
        return FaultAttempt::done(PageFaultError::NotMapped);

    Entry &entry = *m_AddressSpace.m_Entries[index];
    if (!accessAllowed(entry.protection, m_Access))
        return FaultAttempt::done(PageFaultError::Protection);

    Protection enterProtection = entry.protection;

    // Wiring resolves the page for everything the entry allows, so the
    // fault is handled as the widest access and with the map write-locked.
    if (entry.wiredCount)
    {
        m_Access = widestAccess(entry.protection);
        m_bMapWriteLock = true;
    }

    if (entry.needsCopy)
    {
        if (m_Access == AddressSpace::WriteAccess || !entry.object.pObject)
        {
            m_EntryIndex = index;
            m_EntriesVersion = m_AddressSpace.m_EntriesVersion;
            guard.release();
            return copyAnonymousMap();
        }

        // Reads of an object that has not been copied yet see the object
        // page, never a writable one.
        if (enterProtection == ReadWrite)
            enterProtection = Read;
    }

    AnonymousMap *pMap = entry.anonymousMap.pMap;
    if (!pMap)
    {
        if (!entry.object.pObject)
            FATAL("FaultInfo: zero-fill entry at " << Hex << entry.range.address
                  << " has no anonymous map");
        return installObjectPage(entry, enterProtection);
    }

    if (m_bMapWriteLock || m_Access == AddressSpace::WriteAccess)
    {
        WriteLockGuard<AnonymousMap> mapGuard(*pMap);
        return resolveLocked(entry, mapGuard, enterProtection);
    }

    ReadLockGuard<AnonymousMap> mapGuard(*pMap);
    return resolveShared(entry, mapGuard, enterProtection);
}

FaultAttempt FaultInfo::copyAnonymousMap()
{
    WriteLockGuard<AddressSpace> guard(m_AddressSpace);

    // The entry seen under the read lock is still at the same index unless
    // the entries changed while no lock was held.
    size_t index = m_EntryIndex;
    if (m_AddressSpace.m_EntriesVersion != m_EntriesVersion ||
        index >= m_AddressSpace.m_Entries.count() ||
        !m_AddressSpace.m_Entries[index]->range.containsAddress(m_Address))
    {
        if (!m_AddressSpace.entryIndexByAddress(m_Address, index))
            return FaultAttempt::restart();
    }

    Entry &entry = *m_AddressSpace.m_Entries[index];
    if (!entry.needsCopy)
        return FaultAttempt::restart();

    if (!AnonymousMap::copy(guard, entry))
        return FaultAttempt::done(PageFaultError::OutOfMemory);

    ++m_AddressSpace.m_EntriesVersion;
    return FaultAttempt::restart();
}

FaultAttempt FaultInfo::resolveLocked(Entry &entry, WriteLockGuard<AnonymousMap> &mapGuard,
                                      Protection enterProtection)
{
    AnonymousMap &map = mapGuard.object();
    size_t index = mapIndex(entry);

    AnonymousPage *pPage = map.lookup(index);
    if (pPage)
    {
        size_t referenceCount;
        {
            ReadLockGuard<AnonymousPage> pageGuard(*pPage);
            referenceCount = pPage->getReferenceCount();
        }

        if (referenceCount > 1)
        {
            if (m_Access == AddressSpace::WriteAccess)
                return promote(mapGuard, index, pPage->getPhysicalPage(), pPage, enterProtection);

            if (enterProtection == ReadWrite)
                enterProtection = Read;
        }

        return install(pPage->getPhysicalPage(), enterProtection);
    }

    if (!entry.object.pObject)
        return promote(mapGuard, index, 0, 0, enterProtection);

    if (m_Access == AddressSpace::WriteAccess && entry.copyOnWrite)
    {
        physical_uintptr_t source = objectPage(entry);
        if (!source)
            return FaultAttempt::done(PageFaultError::NotMapped);
        return promote(mapGuard, index, source, 0, enterProtection);
    }

    return installObjectPage(entry, enterProtection);
}

FaultAttempt FaultInfo::resolveShared(Entry &entry, ReadLockGuard<AnonymousMap> &mapGuard,
                                      Protection enterProtection)
{
    AnonymousMap &map = mapGuard.object();

    AnonymousPage *pPage = map.lookup(mapIndex(entry));
    if (pPage)
    {
        size_t referenceCount;
        {
            ReadLockGuard<AnonymousPage> pageGuard(*pPage);
            referenceCount = pPage->getReferenceCount();
        }

        if (referenceCount > 1 && enterProtection == ReadWrite)
            enterProtection = Read;

        return install(pPage->getPhysicalPage(), enterProtection);
    }

    if (entry.object.pObject)
        return installObjectPage(entry, enterProtection);

    // A zero page has to be added to the map.
    if (!mapGuard.tryUpgrade())
    {
        m_bMapWriteLock = true;
        return FaultAttempt::restart();
    }

    WriteLockGuard<AnonymousMap> writeGuard(mapGuard);
    return resolveLocked(entry, writeGuard, enterProtection);
}

FaultAttempt FaultInfo::promote(WriteLockGuard<AnonymousMap> &mapGuard, size_t index,
                                physical_uintptr_t source, AnonymousPage *pOld,
                                Protection enterProtection)
{
    AddressSpaceCaches &caches = m_AddressSpace.getCaches();
    PhysicalMemoryManager &physicalMemory = caches.physicalMemory;
    size_t pageSize = m_AddressSpace.getPageSize();

    physical_uintptr_t page = physicalMemory.allocatePage();
    if (!page)
        return FaultAttempt::done(PageFaultError::OutOfMemory);

    void *pDestination = physicalMemory.mapPhysical(page);
    if (source)
        memcpy(pDestination, physicalMemory.mapPhysical(source), pageSize);
    else
        memset(pDestination, 0, pageSize);

    AnonymousPage *pPage = AnonymousPage::create(caches, page);
    if (!pPage)
    {
        physicalMemory.freePage(page);
        return FaultAttempt::done(PageFaultError::OutOfMemory);
    }

    AnonymousMap &map = mapGuard.object();
    if (pOld)
    {
        AnonymousPage *pReplaced = 0;
        if (!map.add(mapGuard, index, pPage, AnonymousMap::Replace, &pReplaced) || pReplaced != pOld)
            FATAL("FaultInfo: anonymous page at index " << index << " changed under the map lock");

        WriteLockGuard<AnonymousPage> oldGuard(*pReplaced);
        AnonymousPage::decrementReferenceCount(oldGuard, caches);
    }
    else if (!map.add(mapGuard, index, pPage, AnonymousMap::Add))
    {
        WriteLockGuard<AnonymousPage> pageGuard(*pPage);
        AnonymousPage::decrementReferenceCount(pageGuard, caches);
        return FaultAttempt::done(PageFaultError::OutOfMemory);
    }

#ifdef DEBUG_ADDRESS_SPACE
    NOTICE("FaultInfo: " << (source ? "copied" : "zero filled") << " page " << Hex << page
           << " at " << m_Address);
#endif

    return install(page, enterProtection);
}

FaultAttempt FaultInfo::installObjectPage(const Entry &entry, Protection enterProtection)
{
    physical_uintptr_t page = objectPage(entry);
    if (!page)
        return FaultAttempt::done(PageFaultError::NotMapped);

    if (entry.copyOnWrite && enterProtection == ReadWrite)
        enterProtection = Read;

    return install(page, enterProtection);
}

FaultAttempt FaultInfo::install(physical_uintptr_t page, Protection protection)
{
    LockGuard<Mutex> guard(m_AddressSpace.m_PageTableLock);

    MapType type(m_AddressSpace.getEnvironment(), protection);
    if (!m_AddressSpace.getPageTable().map(m_Address, page, type))
        return FaultAttempt::done(PageFaultError::OutOfMemory);

    return FaultAttempt::done(PageFaultError::None);
}

physical_uintptr_t FaultInfo::objectPage(const Entry &entry) const
{
    MemoryObject &object = *entry.object.pObject;
    size_t pageSize = m_AddressSpace.getPageSize();
    size_t index = (entry.object.startOffset + (m_Address - entry.range.address)) / pageSize;

    physical_uintptr_t page;
    {
        ReadLockGuard<MemoryObject> guard(object);
        page = object.lookupPage(index);
    }

    if (!page)
        ERROR("FaultInfo: object '" << object.getName() << "' page " << index
              << " is not resident and there is no pager");

    return page;
}

size_t FaultInfo::mapIndex(const Entry &entry) const
{
    return (entry.anonymousMap.startOffset + (m_Address - entry.range.address)) /
           m_AddressSpace.getPageSize();
}
