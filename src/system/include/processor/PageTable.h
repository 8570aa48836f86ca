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

#ifndef KERNEL_PROCESSOR_PAGETABLE_H
#define KERNEL_PROCESSOR_PAGETABLE_H

#include <compiler.h>
#include <processor/types.h>
#include <memory/MapType.h>
#include <memory/VirtualRange.h>

/** @addtogroup kernelprocessor
 * @{ */

/** The PageTable encodes translations for one address space in whatever
 *  format the processor understands. Callers serialise access to it.
 *
 *  Ranges passed in are aligned to getPageSize(). Pages inside a range that
 *  have no translation are skipped. */
class PageTable
{
  public:
    /** Get the size of a standard page
     *\return size of one page in bytes */
    virtual size_t getPageSize() const = 0;

    /** Map one page, replacing any translation already present at
     *  virtualAddress.
     *\param[in] virtualAddress page-aligned virtual address
     *\param[in] physicalAddress the physical page
     *\param[in] type environment, protection and cache attribute
     *\return true if successful, false if the table could not be extended */
    virtual bool map(uintptr_t virtualAddress,
                     physical_uintptr_t physicalAddress,
                     const MapType &type) = 0;

    /** Remove every translation inside range. */
    virtual void unmap(const VirtualRange &range) = 0;

    /** Re-encode every translation inside range with type. */
    virtual void changeProtection(const VirtualRange &range,
                                  const MapType &type) = 0;

    inline virtual ~PageTable(){}

  protected:
    inline PageTable(){}

  private:
    NOT_COPYABLE_OR_ASSIGNABLE(PageTable);
};

/** @} */

#endif
