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

#include <memory/AnonymousMap.h>
#include <memory/AddressSpace.h>
#include <memory/AddressSpaceCaches.h>
#include <memory/Entry.h>
#include <Log.h>

AnonymousMap::AnonymousMap() :
    m_Lock(), m_ReferenceCount(0), m_NumberOfPages(0), m_PagesInUse(0), m_PageSize(0),
    m_Pages()
{
}

AnonymousMap *AnonymousMap::create(AddressSpaceCaches &caches, size_t numberOfPages,
                                   size_t pageSize)
{
    AnonymousMap *pMap = caches.anonymousMaps.allocate();
    if (!pMap)
        return 0;

    pMap->m_ReferenceCount = 1;
    pMap->m_NumberOfPages = numberOfPages;
    pMap->m_PagesInUse = 0;
    pMap->m_PageSize = pageSize;
    pMap->m_Pages.setPool(&caches.anonymousPageChunks);
    return pMap;
}

void AnonymousMap::incrementReferenceCount(WriteLockGuard<AnonymousMap> &guard)
{
    AnonymousMap &map = guard.object();
    if (!map.m_ReferenceCount)
        FATAL("AnonymousMap: reference taken on a dead map");

    ++map.m_ReferenceCount;
}

void AnonymousMap::decrementReferenceCount(WriteLockGuard<AnonymousMap> &guard,
                                           AddressSpaceCaches &caches)
{
    AnonymousMap &map = guard.object();
    if (!map.m_ReferenceCount)
        FATAL("AnonymousMap: reference dropped on a dead map");

    if (--map.m_ReferenceCount)
    {
        guard.release();
        return;
    }

    // Last reference: nobody else can reach the map any more.
    map.releasePages(guard, 0, map.m_NumberOfPages, caches);
    if (map.m_PagesInUse)
        FATAL("AnonymousMap: " << map.m_PagesInUse << " pages outside the map's range");

    map.m_Pages.clear();
    map.m_NumberOfPages = 0;
    guard.release();

    caches.anonymousMaps.deallocate(&map);
}

bool AnonymousMap::copy(WriteLockGuard<AddressSpace> &guard, Entry &entry)
{
    AddressSpace &addressSpace = guard.object();
    AddressSpaceCaches &caches = addressSpace.getCaches();
    size_t pageSize = addressSpace.getPageSize();

    if (!entry.anonymousMap.pMap)
    {
        AnonymousMap *pMap = create(caches, entry.range.size / pageSize, pageSize);
        if (!pMap)
            return false;

        entry.anonymousMap.pMap = pMap;
        entry.anonymousMap.startOffset = 0;
        entry.needsCopy = false;
        return true;
    }

    AnonymousMap *pOld = entry.anonymousMap.pMap;
    WriteLockGuard<AnonymousMap> oldGuard(*pOld);

    if (pOld->m_ReferenceCount == 1)
    {
        entry.needsCopy = false;
        return true;
    }

    AnonymousMap *pNew = create(caches, entry.range.size / pageSize, pageSize);
    if (!pNew)
        return false;

    size_t first = entry.anonymousMap.startOffset / pageSize;
    size_t count = entry.range.size / pageSize;

    Vector<size_t> indices;
    pOld->populatedIndices(first, count, indices);

    WriteLockGuard<AnonymousMap> newGuard(*pNew);
    for (Vector<size_t>::Iterator it = indices.begin(); it != indices.end(); ++it)
    {
        AnonymousPage *pPage = pOld->m_Pages.get(*it);

        {
            WriteLockGuard<AnonymousPage> pageGuard(*pPage);
            AnonymousPage::incrementReferenceCount(pageGuard);
        }

        if (!pNew->add(newGuard, *it - first, pPage, Add))
        {
            WriteLockGuard<AnonymousPage> pageGuard(*pPage);
            AnonymousPage::decrementReferenceCount(pageGuard, caches);

            // Drops the pages shared so far.
            decrementReferenceCount(newGuard, caches);
            return false;
        }
    }
    newGuard.release();

    DEBUG_LOG("AnonymousMap::copy: shared " << indices.count() << " pages into a new map");

    entry.anonymousMap.pMap = pNew;
    entry.anonymousMap.startOffset = 0;
    entry.needsCopy = false;

    decrementReferenceCount(oldGuard, caches);
    return true;
}

bool AnonymousMap::add(WriteLockGuard<AnonymousMap> &guard, size_t index, AnonymousPage *pPage,
                       AddOperation operation, AnonymousPage **pOldPage)
{
    if (&guard.object() != this)
        FATAL("AnonymousMap::add: guard is for another map");

    if (index >= m_NumberOfPages)
        FATAL("AnonymousMap::add: index " << index << " past the end of a " << m_NumberOfPages << " page map");

    if (operation == Add)
    {
        if (m_Pages.get(index))
            FATAL("AnonymousMap::add: slot " << index << " is already populated");

        if (!m_Pages.ensureChunk(index))
            return false;

        m_Pages.set(index, pPage);
        ++m_PagesInUse;
        return true;
    }

    if (!m_Pages.get(index))
        FATAL("AnonymousMap::add: replacing empty slot " << index);

    AnonymousPage *pOld = m_Pages.set(index, pPage);
    if (pOldPage)
        *pOldPage = pOld;
    return true;
}

void AnonymousMap::grow(WriteLockGuard<AnonymousMap> &guard, size_t numberOfPages)
{
    if (&guard.object() != this)
        FATAL("AnonymousMap::grow: guard is for another map");

    if (numberOfPages > m_NumberOfPages)
        m_NumberOfPages = numberOfPages;
}

void AnonymousMap::releasePages(WriteLockGuard<AnonymousMap> &guard, size_t first, size_t count,
                                AddressSpaceCaches &caches)
{
    if (&guard.object() != this)
        FATAL("AnonymousMap::releasePages: guard is for another map");

    // Collect first: taking slots may free the chunk being iterated.
    Vector<size_t> indices;
    populatedIndices(first, count, indices);

    for (Vector<size_t>::Iterator it = indices.begin(); it != indices.end(); ++it)
    {
        AnonymousPage *pPage = m_Pages.take(*it);
        --m_PagesInUse;

        WriteLockGuard<AnonymousPage> pageGuard(*pPage);
        AnonymousPage::decrementReferenceCount(pageGuard, caches);
    }
}

void AnonymousMap::populatedIndices(size_t first, size_t count, Vector<size_t> &indices) const
{
    for (PageChunkMap::Iterator it = m_Pages.begin(); it != m_Pages.end(); ++it)
    {
        PageChunkMap::Chunk *pChunk = *it;
        size_t base = PageChunkMap::firstIndex(it);
        if (base >= first + count || base + PageChunkMap::slotsPerChunk <= first)
            continue;

        for (size_t i = 0; i < PageChunkMap::slotsPerChunk; ++i)
        {
            size_t index = base + i;
            if (index >= first && index < first + count && pChunk->slots[i])
                indices.pushBack(index);
        }
    }
}

void AnonymousMap::print(size_t indent)
{
    ReadLockGuard<AnonymousMap> guard(*this);

    NormalStaticString pad;
    pad.pad(indent);

    NOTICE(pad << "AnonymousMap{ reference_count: " << m_ReferenceCount << ", pages: "
           << m_NumberOfPages << ", in_use: " << m_PagesInUse << " }");
}
