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

#ifndef KERNEL_PROCESS_MUTEX_H
#define KERNEL_PROCESS_MUTEX_H

#include <Atomic.h>
#include <compiler.h>
#include <processor/types.h>

/** @addtogroup kernelprocess
 * @{ */

/**
 * A blocking mutual-exclusion lock. Unlike a Spinlock, a Mutex may be held
 * across operations that block (such as physical memory allocation), and
 * a thread waiting on it yields the processor.
 */
class Mutex
{
  public:
    Mutex();
    ~Mutex();

    /** Acquires the mutex, blocking until it is available. */
    bool acquire();

    /** Attempts to acquire the mutex without blocking.
     *\return true if the mutex is now held by the caller */
    bool tryAcquire();

    /** Releases the mutex. Must be held by the caller. */
    void release();

    /** Whether any context holds the mutex. */
    bool isLocked() const
    {
        return m_Locked;
    }

    /** Whether the calling context holds the mutex. */
    bool isLockedByCurrent() const;

  private:
    NOT_COPYABLE_OR_ASSIGNABLE(Mutex);

    Atomic<bool> m_Locked;
    Atomic<uintptr_t> m_Owner;
};

/** @} */

#endif
