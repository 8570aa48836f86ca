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

#ifndef KERNEL_PROCESSOR_HOSTED_PHYSICALMEMORYMANAGER_H
#define KERNEL_PROCESSOR_HOSTED_PHYSICALMEMORYMANAGER_H

#include <compiler.h>
#include <utilities/Vector.h>
#include <processor/PhysicalMemoryManager.h>
#include <Spinlock.h>

/** @addtogroup kernelprocessorhosted
 * @{ */

/** Physical address of the first page of the hosted RAM pool. Zero is kept
 *  free so that allocatePage() can use it to report exhaustion. */
#define HOSTED_PHYSICAL_BASE 0x100000

/** The hosted implementation of the PhysicalMemoryManager. "Physical" memory
 *  is a pool of anonymous host memory, handed out page by page from a stack.
 *\brief Implementation of the PhysicalMemoryManager for hosted builds */
class HostedPhysicalMemoryManager : public PhysicalMemoryManager
{
  public:
    /** Creates a pool of pageCount pages of pageSize bytes each. */
    HostedPhysicalMemoryManager(size_t pageSize, size_t pageCount);
    virtual ~HostedPhysicalMemoryManager();

    //
    // PhysicalMemoryManager Interface
    //
    virtual size_t getPageSize() const
    {
      return m_PageSize;
    }
    virtual physical_uintptr_t allocatePage();
    virtual void freePage(physical_uintptr_t page);
    virtual void *mapPhysical(physical_uintptr_t page);

    /** Number of pages currently handed out. */
    size_t getAllocatedPageCount() const
    {
      return m_PageCount - m_PageStack.count();
    }

    /** Number of pages left in the pool. */
    size_t getFreePageCount() const
    {
      return m_PageStack.count();
    }

  private:
    NOT_COPYABLE_OR_ASSIGNABLE(HostedPhysicalMemoryManager);

    /** Index of page in the pool, FATAL if it isn't one of ours. */
    size_t pageIndex(physical_uintptr_t page) const;

    size_t m_PageSize;
    size_t m_PageCount;

    /** Host memory backing the pool. */
    uint8_t *m_pPool;

    /** Free pages. */
    Vector<physical_uintptr_t> m_PageStack;

    /** Which pages are allocated, to catch double frees. */
    Vector<bool> m_Allocated;

    Spinlock m_Lock;
};

/** @} */

#endif
