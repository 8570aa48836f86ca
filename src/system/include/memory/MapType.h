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

#ifndef KERNEL_MEMORY_MAPTYPE_H
#define KERNEL_MEMORY_MAPTYPE_H

#include <processor/types.h>

class Process;

/** @addtogroup kernelmemory
 * @{ */

/** Access allowed on a range. Values are ordered: a larger value never
 *  permits less than a smaller one as far as maximum protection checks are
 *  concerned. */
enum Protection
{
    None = 0,
    Read,
    ReadWrite,
    Execute
};

const char *protectionName(Protection protection);

/** Cache attribute of a translation. */
enum CacheType
{
    WriteBack = 0,
    WriteCombining,
    Uncached
};

const char *cacheTypeName(CacheType cacheType);

/** Who an address space belongs to. */
struct Environment
{
    enum Type
    {
        Kernel = 0,
        User
    };

    static Environment kernel()
    {
        Environment env = {Kernel, 0};
        return env;
    }

    static Environment user(Process *pProcess)
    {
        Environment env = {User, pProcess};
        return env;
    }

    bool isUser() const
    {
        return type == User;
    }

    Type type;
    /** The process for a User environment, null for the kernel. */
    Process *pProcess;
};

/** Everything the page table needs to know to encode a translation. */
struct MapType
{
    MapType(Environment env, Protection prot, CacheType cache = WriteBack) :
        environment(env), protection(prot), cacheType(cache)
    {
    }

    Environment environment;
    Protection protection;
    CacheType cacheType;
};

/** @} */

#endif
