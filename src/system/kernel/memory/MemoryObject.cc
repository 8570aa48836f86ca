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

#include <memory/MemoryObject.h>
#include <Log.h>

MemoryObject::MemoryObject(const char *name, PhysicalMemoryManager &physicalMemory) :
    m_Lock(), m_ReferenceCount(1), m_nResident(0), m_PhysicalMemory(physicalMemory),
    m_Name(name), m_ChunkPool(), m_Pages(&m_ChunkPool)
{
}

MemoryObject::~MemoryObject()
{
    Vector<PhysicalPage *> pages;
    for (PhysicalPageChunkMap::Iterator it = m_Pages.begin(); it != m_Pages.end(); ++it)
    {
        PhysicalPageChunkMap::Chunk *pChunk = *it;
        for (size_t i = 0; i < PhysicalPageChunkMap::slotsPerChunk; ++i)
        {
            if (pChunk->slots[i])
                pages.pushBack(pChunk->slots[i]);
        }
    }

    for (Vector<PhysicalPage *>::Iterator it = pages.begin(); it != pages.end(); ++it)
    {
        m_PhysicalMemory.freePage((*it)->address);
        delete *it;
    }

    m_Pages.clear();
}

void MemoryObject::incrementReferenceCount(WriteLockGuard<MemoryObject> &guard)
{
    MemoryObject &object = guard.object();
    if (!object.m_ReferenceCount)
        FATAL("MemoryObject '" << object.m_Name << "': reference taken on a dead object");

    ++object.m_ReferenceCount;
}

void MemoryObject::decrementReferenceCount(WriteLockGuard<MemoryObject> &guard)
{
    MemoryObject &object = guard.object();
    if (!object.m_ReferenceCount)
        FATAL("MemoryObject '" << object.m_Name << "': reference dropped on a dead object");

    size_t referenceCount = --object.m_ReferenceCount;
    guard.release();

    if (!referenceCount)
    {
        DEBUG_LOG("MemoryObject '" << object.m_Name << "': destroyed with " << object.m_nResident << " resident pages");
        delete &object;
    }
}

bool MemoryObject::insertPage(size_t index, physical_uintptr_t page)
{
    WriteLockGuard<MemoryObject> guard(*this);

    if (m_Pages.get(index))
    {
        WARNING("MemoryObject '" << m_Name << "': page " << index << " is already resident");
        return false;
    }

    if (!m_Pages.ensureChunk(index))
        return false;

    PhysicalPage *pPage = new PhysicalPage;
    pPage->address = page;
    m_Pages.set(index, pPage);
    ++m_nResident;

    return true;
}

void MemoryObject::print(size_t indent)
{
    ReadLockGuard<MemoryObject> guard(*this);

    NormalStaticString pad;
    pad.pad(indent);

    NOTICE(pad << "MemoryObject{ name: " << m_Name << ", reference_count: " << m_ReferenceCount
           << ", resident_pages: " << m_nResident << " }");
}
