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

#ifndef KERNEL_PROCESSOR_PHYSICALMEMORYMANAGER_H
#define KERNEL_PROCESSOR_PHYSICALMEMORYMANAGER_H

#include <compiler.h>
#include <processor/types.h>

/** @addtogroup kernelprocessor
 * @{ */

/** The PhysicalMemoryManager manages the physical address space. That means it provides
 *  functions to allocate and free pages.
 *
 *  The memory manager is handed an instance at construction rather than
 *  reaching for a global one, so several can coexist. */
class PhysicalMemoryManager
{
  public:
    /** Get the size of one page
     *\return size of one page in bytes */
    virtual size_t getPageSize() const = 0;
    /** Allocate a 'normal' page. Normal means that the page does not need to fullfill any
     *  constraints. These kinds of pages can be used to map normal memory into a virtual
     *  address space.
     *\return physical address of the page or 0 if no page available */
    virtual physical_uintptr_t allocatePage() = 0;
    /** Free a page allocated with the allocatePage() function
     *\param[in] page physical address of the page */
    virtual void freePage(physical_uintptr_t page) = 0;
    /** Get a pointer through which the contents of a physical page can be
     *  accessed (the direct map).
     *\param[in] page physical address of the page
     *\return pointer to the first byte of the page */
    virtual void *mapPhysical(physical_uintptr_t page) = 0;

    /** The destructor */
    inline virtual ~PhysicalMemoryManager(){}

  protected:
    /** The constructor */
    inline PhysicalMemoryManager(){}

  private:
    NOT_COPYABLE_OR_ASSIGNABLE(PhysicalMemoryManager);
};

/** @} */

#endif
