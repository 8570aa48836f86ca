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

#ifndef KERNEL_SPINLOCK_H
#define KERNEL_SPINLOCK_H

#include <Atomic.h>
#include <compiler.h>

class Spinlock
{
  public:
    inline Spinlock(bool bLocked = false)
        : m_Atom(!bLocked), m_Magic(0xdeadbaba), m_Owner(0) {}

    /** Enter the critical section. */
    bool acquire();

    /** Try to enter the critical section without spinning.
     *\return true if the lock was taken */
    bool tryAcquire();

    /** Exit the critical section. */
    void release();

    bool acquired() const
    {
        return !m_Atom;
    }

  private:
    NOT_COPYABLE_OR_ASSIGNABLE(Spinlock);

    Atomic<bool> m_Atom;
    uint32_t m_Magic;

    /** Context currently holding the lock, for deadlock reports. */
    Atomic<uintptr_t> m_Owner;
};

#endif
