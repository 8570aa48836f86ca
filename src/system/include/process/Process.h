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

#ifndef KERNEL_PROCESS_PROCESS_H
#define KERNEL_PROCESS_PROCESS_H

#include <processor/types.h>
#include <utilities/StaticString.h>
#include <memory/config.h>

/** @addtogroup kernelprocess
 * @{ */

/**
 * The parts of a process the memory manager cares about: an identity and a
 * name. User address spaces are bound to one of these and take their name
 * from it.
 */
class Process
{
public:
    Process(size_t id, const char *name) : m_Id(id), m_Name(name)
    {
    }

    virtual ~Process()
    {
    }

    size_t getId() const
    {
        return m_Id;
    }

    const StaticString<ADDRESS_SPACE_NAME_LENGTH> &getName() const
    {
        return m_Name;
    }

private:
    size_t m_Id;
    StaticString<ADDRESS_SPACE_NAME_LENGTH> m_Name;
};

/** @} */

#endif
