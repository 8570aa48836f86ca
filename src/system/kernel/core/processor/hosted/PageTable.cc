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

#include <Log.h>
#include "PageTable.h"

HostedPageTable::HostedPageTable(size_t pageSize, size_t limit) :
    m_PageSize(pageSize), m_Limit(limit), m_Mappings(64)
{
    if (!pageSize || (pageSize & (pageSize - 1)))
        FATAL("HostedPageTable: page size " << pageSize << " is not a power of two");
}

HostedPageTable::~HostedPageTable()
{
    for (HashTable<PageKey, Mapping>::Iterator it = m_Mappings.begin();
         it != m_Mappings.end();
         ++it)
    {
        delete *it;
    }
}

bool HostedPageTable::map(uintptr_t virtualAddress,
                          physical_uintptr_t physicalAddress,
                          const MapType &type)
{
    if (virtualAddress & (m_PageSize - 1))
        FATAL("HostedPageTable::map: misaligned address " << Hex << virtualAddress);

    PageKey key(virtualAddress / m_PageSize);
    Mapping *pMapping = m_Mappings.lookup(key);
    if (!pMapping)
    {
        if (m_Limit && m_Mappings.count() >= m_Limit)
            return false;

        pMapping = new Mapping;
        m_Mappings.insert(key, pMapping);
    }

    pMapping->physical = physicalAddress;
    pMapping->environment = type.environment.type;
    pMapping->protection = type.protection;
    pMapping->cacheType = type.cacheType;
    return true;
}

void HostedPageTable::keysInRange(const VirtualRange &range, Vector<uintptr_t> &keys) const
{
    if (!range.size)
        return;

    uintptr_t first = range.address / m_PageSize;
    uintptr_t last = range.last() / m_PageSize;

    for (HashTable<PageKey, Mapping>::Iterator it = m_Mappings.begin();
         it != m_Mappings.end();
         ++it)
    {
        uintptr_t page = it.key().page;
        if (page >= first && page <= last)
            keys.pushBack(page);
    }
}

void HostedPageTable::unmap(const VirtualRange &range)
{
    Vector<uintptr_t> keys;
    keysInRange(range, keys);

    for (Vector<uintptr_t>::Iterator it = keys.begin(); it != keys.end(); ++it)
    {
        delete m_Mappings.remove(PageKey(*it));
    }
}

void HostedPageTable::changeProtection(const VirtualRange &range,
                                       const MapType &type)
{
    Vector<uintptr_t> keys;
    keysInRange(range, keys);

    for (Vector<uintptr_t>::Iterator it = keys.begin(); it != keys.end(); ++it)
    {
        Mapping *pMapping = m_Mappings.lookup(PageKey(*it));
        pMapping->environment = type.environment.type;
        pMapping->protection = type.protection;
        pMapping->cacheType = type.cacheType;
    }
}

bool HostedPageTable::getMapping(uintptr_t virtualAddress, Mapping &mapping) const
{
    Mapping *pMapping = m_Mappings.lookup(PageKey(virtualAddress / m_PageSize));
    if (!pMapping)
        return false;

    mapping = *pMapping;
    return true;
}
