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

#ifndef KERNEL_UTILITIES_RWLOCK_H
#define KERNEL_UTILITIES_RWLOCK_H

#include <Atomic.h>
#include <compiler.h>
#include <processor/types.h>

/** A readers/writer lock. Any number of readers can hold the lock at once;
    a writer excludes everyone else.

    The lock state is a single counter: zero when free, the number of
    readers while read-locked, and WRITE_LOCKED while a writer holds it.
    Waiting writers are counted so that new readers back off and writers
    are not starved by a stream of overlapping readers.
*/
class RwLock
{
public:
    RwLock();
    ~RwLock();

    /** Acquires the lock for reading, blocking while a writer holds it. */
    void acquireRead();

    /** Attempts to acquire the lock for reading without blocking. */
    bool tryAcquireRead();

    /** Drops a read lock. */
    void releaseRead();

    /** Acquires the lock for writing, blocking until all readers and any
        writer have left. */
    void acquireWrite();

    /** Attempts to acquire the lock for writing without blocking. */
    bool tryAcquireWrite();

    /** Drops the write lock. */
    void releaseWrite();

    /** Upgrades a read lock held by the caller to a write lock. This only
        succeeds when the caller is the sole reader.
        \return true if the caller now holds the write lock. On failure the
                read lock has been released and the caller holds nothing. */
    bool tryUpgrade();

    bool isReadLocked() const
    {
        return m_Counter > 0;
    }

    bool isWriteLocked() const
    {
        return m_Counter == WRITE_LOCKED;
    }

    /** Whether the calling context holds the write lock. */
    bool isWriteLockedByCurrent() const;

private:
    NOT_COPYABLE_OR_ASSIGNABLE(RwLock);

    static const ssize_t WRITE_LOCKED = -1;

    Atomic<ssize_t> m_Counter;
    Atomic<size_t> m_WritersWaiting;
    Atomic<uintptr_t> m_Writer;
};

#endif
