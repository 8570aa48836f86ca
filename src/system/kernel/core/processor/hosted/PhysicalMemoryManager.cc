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
#include <panic.h>
#include <LockGuard.h>
#include "PhysicalMemoryManager.h"

#include <sys/mman.h>
#include <string.h>

HostedPhysicalMemoryManager::HostedPhysicalMemoryManager(size_t pageSize, size_t pageCount) :
    m_PageSize(pageSize), m_PageCount(pageCount), m_pPool(0), m_PageStack(),
    m_Allocated(), m_Lock()
{
    if (!pageSize || (pageSize & (pageSize - 1)))
        FATAL("HostedPhysicalMemoryManager: page size " << pageSize << " is not a power of two");

    if (pageCount)
    {
        void *p = mmap(0, pageSize * pageCount, PROT_READ | PROT_WRITE,
                       MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
        if (p == MAP_FAILED)
            FATAL("HostedPhysicalMemoryManager: could not reserve " << pageCount << " pages");
        m_pPool = reinterpret_cast<uint8_t *>(p);
    }

    m_PageStack.reserve(pageCount);
    // Push in reverse so pages come out lowest address first.
    for (size_t i = pageCount; i > 0; --i)
    {
        m_PageStack.pushBack(HOSTED_PHYSICAL_BASE + (i - 1) * pageSize);
        m_Allocated.pushBack(false);
    }

    DEBUG_LOG("HostedPhysicalMemoryManager: " << pageCount << " pages of " << Hex << pageSize << " bytes");
}

HostedPhysicalMemoryManager::~HostedPhysicalMemoryManager()
{
    if (getAllocatedPageCount())
        WARNING("HostedPhysicalMemoryManager: destroyed with " << getAllocatedPageCount() << " pages still allocated");

    if (m_pPool)
        munmap(m_pPool, m_PageSize * m_PageCount);
}

size_t HostedPhysicalMemoryManager::pageIndex(physical_uintptr_t page) const
{
    if (page < HOSTED_PHYSICAL_BASE || (page & (m_PageSize - 1)))
        FATAL("HostedPhysicalMemoryManager: bad physical page " << Hex << page);

    size_t index = (page - HOSTED_PHYSICAL_BASE) / m_PageSize;
    if (index >= m_PageCount)
        FATAL("HostedPhysicalMemoryManager: physical page " << Hex << page << " is out of range");

    return index;
}

physical_uintptr_t HostedPhysicalMemoryManager::allocatePage()
{
    LockGuard<Spinlock> guard(m_Lock);

    if (!m_PageStack.count())
    {
        DEBUG_LOG("HostedPhysicalMemoryManager: out of pages");
        return 0;
    }

    physical_uintptr_t page = m_PageStack.popBack();
    m_Allocated[pageIndex(page)] = true;
    return page;
}

void HostedPhysicalMemoryManager::freePage(physical_uintptr_t page)
{
    LockGuard<Spinlock> guard(m_Lock);

    size_t index = pageIndex(page);
    if (!m_Allocated[index])
    {
        m_Lock.release();
        FATAL("PhysicalMemoryManager DOUBLE FREE of " << Hex << page);
    }

    m_Allocated[index] = false;
    m_PageStack.pushBack(page);
}

void *HostedPhysicalMemoryManager::mapPhysical(physical_uintptr_t page)
{
    return m_pPool + pageIndex(page) * m_PageSize;
}
