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

#include <memory/Entry.h>
#include <memory/AddressSpaceCaches.h>
#include <memory/AnonymousMap.h>
#include <memory/MemoryObject.h>
#include <Log.h>

Entry::Entry() :
    range(), protection(None), maxProtection(None), anonymousMap(), object(),
    copyOnWrite(false), needsCopy(false), wiredCount(0)
{
}

Entry *Entry::create(AddressSpaceCaches &caches)
{
    Entry *pEntry = caches.entries.allocate();
    if (pEntry)
        *pEntry = Entry();
    return pEntry;
}

bool Entry::createMany(AddressSpaceCaches &caches, Entry **pEntries, size_t count)
{
    if (!caches.entries.allocateMany(pEntries, count))
        return false;

    for (size_t i = 0; i < count; ++i)
        *pEntries[i] = Entry();
    return true;
}

void Entry::destroy(AddressSpaceCaches &caches, Entry *pEntry)
{
    caches.entries.deallocate(pEntry);
}

bool Entry::canMerge(const Entry &following) const
{
    if (protection != following.protection || maxProtection != following.maxProtection)
        return false;
    if (copyOnWrite != following.copyOnWrite || wiredCount != following.wiredCount)
        return false;
    if (following.range.address != range.endBound())
        return false;

    if (object.pObject || following.object.pObject)
    {
        if (object.pObject != following.object.pObject)
            return false;
        if (object.startOffset + range.size != following.object.startOffset)
            return false;
    }

    AnonymousMap *pMap = anonymousMap.pMap;
    AnonymousMap *pFollowingMap = following.anonymousMap.pMap;

    if (pMap && pFollowingMap)
    {
        return pMap == pFollowingMap &&
               anonymousMap.startOffset + range.size == following.anonymousMap.startOffset &&
               needsCopy == following.needsCopy;
    }

    if (pMap)
    {
        if (needsCopy || !following.needsCopy)
            return false;

        ReadLockGuard<AnonymousMap> guard(*pMap);
        return pMap->getReferenceCount() == 1;
    }

    if (pFollowingMap)
    {
        if (following.needsCopy || !needsCopy)
            return false;
        if (following.anonymousMap.startOffset < range.size)
            return false;

        ReadLockGuard<AnonymousMap> guard(*pFollowingMap);
        return pFollowingMap->getReferenceCount() == 1;
    }

    return needsCopy == following.needsCopy;
}

void Entry::merge(Entry &following, AddressSpaceCaches &caches)
{
    AnonymousMap *pMap = anonymousMap.pMap;
    AnonymousMap *pFollowingMap = following.anonymousMap.pMap;

    if (pMap && pFollowingMap)
    {
        WriteLockGuard<AnonymousMap> guard(*pFollowingMap);
        AnonymousMap::decrementReferenceCount(guard, caches);
    }
    else if (pFollowingMap)
    {
        // Slots the map held below following's window belong to nobody;
        // they must read as unpopulated once this entry covers them.
        WriteLockGuard<AnonymousMap> guard(*pFollowingMap);
        size_t pageSize = pFollowingMap->getPageSize();
        size_t startOffset = following.anonymousMap.startOffset - range.size;
        pFollowingMap->releasePages(guard, startOffset / pageSize, range.size / pageSize, caches);

        anonymousMap.pMap = pFollowingMap;
        anonymousMap.startOffset = startOffset;
        needsCopy = false;
    }
    else if (pMap)
    {
        WriteLockGuard<AnonymousMap> guard(*pMap);
        size_t pageSize = pMap->getPageSize();
        size_t end = anonymousMap.startOffset + range.size;
        pMap->grow(guard, (end + following.range.size) / pageSize);
        pMap->releasePages(guard, end / pageSize, following.range.size / pageSize, caches);
    }

    if (object.pObject)
    {
        WriteLockGuard<MemoryObject> guard(*following.object.pObject);
        MemoryObject::decrementReferenceCount(guard);
    }

    range.size += following.range.size;

    following.anonymousMap.pMap = 0;
    following.object.pObject = 0;
}

void Entry::split(Entry &newEntry, size_t offset)
{
    if (!offset || offset >= range.size)
        FATAL("Entry::split: offset " << Hex << offset << " outside entry of size " << range.size);

    newEntry = *this;
    newEntry.range.address += offset;
    newEntry.range.size -= offset;
    range.size = offset;

    if (newEntry.anonymousMap.pMap)
    {
        newEntry.anonymousMap.startOffset += offset;

        WriteLockGuard<AnonymousMap> guard(*newEntry.anonymousMap.pMap);
        AnonymousMap::incrementReferenceCount(guard);
    }

    if (newEntry.object.pObject)
    {
        newEntry.object.startOffset += offset;

        WriteLockGuard<MemoryObject> guard(*newEntry.object.pObject);
        MemoryObject::incrementReferenceCount(guard);
    }
}

void Entry::shrink(ShrinkDirection direction, size_t newSize, bool freePages,
                   AddressSpaceCaches &caches)
{
    if (!newSize || newSize >= range.size)
        FATAL("Entry::shrink: bad size " << Hex << newSize << " for entry of size " << range.size);

    size_t cut = range.size - newSize;

    if (direction == FromEnd)
    {
        releaseWindow(newSize, cut, freePages, caches);
        range.size = newSize;
        return;
    }

    releaseWindow(0, cut, freePages, caches);
    range.address += cut;
    range.size = newSize;

    if (anonymousMap.pMap)
        anonymousMap.startOffset += cut;
    if (object.pObject)
        object.startOffset += cut;
}

void Entry::dropReferences(bool freePages, AddressSpaceCaches &caches)
{
    releaseWindow(0, range.size, freePages, caches);

    if (anonymousMap.pMap)
    {
        WriteLockGuard<AnonymousMap> guard(*anonymousMap.pMap);
        AnonymousMap::decrementReferenceCount(guard, caches);
        anonymousMap.pMap = 0;
    }

    if (object.pObject)
    {
        WriteLockGuard<MemoryObject> guard(*object.pObject);
        MemoryObject::decrementReferenceCount(guard);
        object.pObject = 0;
    }
}

void Entry::releaseWindow(size_t offset, size_t size, bool freePages,
                          AddressSpaceCaches &caches)
{
    AnonymousMap *pMap = anonymousMap.pMap;
    if (!pMap || !freePages || needsCopy)
        return;

    WriteLockGuard<AnonymousMap> guard(*pMap);
    size_t pageSize = pMap->getPageSize();
    pMap->releasePages(guard, (anonymousMap.startOffset + offset) / pageSize, size / pageSize,
                       caches);
}

void Entry::print(size_t indent) const
{
    NormalStaticString pad;
    pad.pad(indent);

    NOTICE(pad << "Entry{ range: [" << Hex << range.address << ", " << range.endBound()
           << "), protection: " << protectionName(protection) << ", max_protection: "
           << protectionName(maxProtection) << ", copy_on_write: " << copyOnWrite
           << ", needs_copy: " << needsCopy << ", wired: " << Dec << wiredCount << " }");

    if (anonymousMap.pMap)
    {
        NOTICE(pad << "  anonymous map at offset " << Hex << anonymousMap.startOffset << ":");
        anonymousMap.pMap->print(indent + 4);
    }

    if (object.pObject)
    {
        NOTICE(pad << "  object at offset " << Hex << object.startOffset << ":");
        object.pObject->print(indent + 4);
    }
}
