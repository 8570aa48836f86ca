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

#ifndef KERNEL_PROCESSOR_HOSTED_PAGETABLE_H
#define KERNEL_PROCESSOR_HOSTED_PAGETABLE_H

#include <compiler.h>
#include <utilities/HashTable.h>
#include <processor/PageTable.h>

/** @addtogroup kernelprocessorhosted
 * @{ */

/** The hosted PageTable keeps translations in a hash table keyed by virtual
 *  page instead of encoding them for real hardware. */
class HostedPageTable : public PageTable
{
  public:
    /** One translation. */
    struct Mapping
    {
      Mapping() : physical(0), environment(Environment::Kernel),
        protection(None), cacheType(WriteBack)
      {
      }

      physical_uintptr_t physical;
      Environment::Type environment;
      Protection protection;
      CacheType cacheType;
    };

    /** Creates an empty table.
     *\param[in] pageSize size of a standard page, a power of two
     *\param[in] limit maximum number of translations, zero for unlimited */
    HostedPageTable(size_t pageSize, size_t limit = 0);
    virtual ~HostedPageTable();

    //
    // PageTable Interface
    //
    virtual size_t getPageSize() const
    {
      return m_PageSize;
    }
    virtual bool map(uintptr_t virtualAddress,
                     physical_uintptr_t physicalAddress,
                     const MapType &type);
    virtual void unmap(const VirtualRange &range);
    virtual void changeProtection(const VirtualRange &range,
                                  const MapType &type);

    /** Get the translation for a virtual address.
     *\return true if virtualAddress is mapped */
    bool getMapping(uintptr_t virtualAddress, Mapping &mapping) const;

    /** Number of translations present. */
    size_t count() const
    {
      return m_Mappings.count();
    }

    void setLimit(size_t limit)
    {
      m_Limit = limit;
    }

  private:
    NOT_COPYABLE_OR_ASSIGNABLE(HostedPageTable);

    struct PageKey
    {
      PageKey() : page(0)
      {
      }

      PageKey(uintptr_t p) : page(p)
      {
      }

      size_t hash() const
      {
        return page;
      }

      bool operator == (const PageKey &other) const
      {
        return page == other.page;
      }

      uintptr_t page;
    };

    /** Collects the keys of every translation inside range. */
    void keysInRange(const VirtualRange &range, Vector<uintptr_t> &keys) const;

    size_t m_PageSize;
    size_t m_Limit;

    HashTable<PageKey, Mapping> m_Mappings;
};

/** @} */

#endif
