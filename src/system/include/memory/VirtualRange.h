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

#ifndef KERNEL_MEMORY_VIRTUALRANGE_H
#define KERNEL_MEMORY_VIRTUALRANGE_H

#include <processor/types.h>

/** @addtogroup kernelmemory
 * @{ */

/** A half-open range of virtual addresses [address, address + size). */
struct VirtualRange
{
    VirtualRange() : address(0), size(0)
    {
    }

    VirtualRange(uintptr_t base, size_t length) : address(base), size(length)
    {
    }

    /** First address past the end of the range. */
    uintptr_t endBound() const
    {
        return address + size;
    }

    /** Last address inside the range. Only meaningful for non-empty ranges;
     *  unlike endBound() it cannot overflow for a range ending at the top of
     *  the address space. */
    uintptr_t last() const
    {
        return address + size - 1;
    }

    /** Whether the range runs past the top of the address space. */
    bool wraps() const
    {
        return size && last() < address;
    }

    bool containsAddress(uintptr_t addr) const
    {
        return addr >= address && addr <= last();
    }

    bool fullyContains(const VirtualRange &other) const
    {
        return other.address >= address && other.last() <= last();
    }

    bool anyOverlap(const VirtualRange &other) const
    {
        if (!size || !other.size)
            return false;
        return address <= other.last() && other.address <= last();
    }

    bool operator == (const VirtualRange &other) const
    {
        return address == other.address && size == other.size;
    }

    bool operator != (const VirtualRange &other) const
    {
        return !(*this == other);
    }

    uintptr_t address;
    size_t size;
};

/** @} */

#endif
