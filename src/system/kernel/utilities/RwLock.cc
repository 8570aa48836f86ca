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

#include <utilities/RwLock.h>
#include <processor/Processor.h>
#include <Log.h>

RwLock::RwLock() :
    m_Counter(0), m_WritersWaiting(0), m_Writer(0)
{
}

RwLock::~RwLock()
{
    if (m_Counter != 0)
        WARNING("RwLock destroyed while held [this=" << Hex << reinterpret_cast<uintptr_t>(this) << "]");
}

void RwLock::acquireRead()
{
    while (!tryAcquireRead())
        Processor::pause();
}

bool RwLock::tryAcquireRead()
{
    // Give way to writers that are already queued.
    if (m_WritersWaiting)
        return false;

    ssize_t current = m_Counter;
    if (current == WRITE_LOCKED)
        return false;

    return m_Counter.compareAndSwap(current, current + 1);
}

void RwLock::releaseRead()
{
    ssize_t current;
    do
    {
        current = m_Counter;
        if (current <= 0)
        {
            FATAL("RwLock: releaseRead() without a read lock [this=" << Hex << reinterpret_cast<uintptr_t>(this) << "]");
        }
    } while (!m_Counter.compareAndSwap(current, current - 1));
}

void RwLock::acquireWrite()
{
    if (m_Writer == Processor::currentContext())
    {
        FATAL("RwLock: recursive write acquire [this=" << Hex << reinterpret_cast<uintptr_t>(this) << "]");
    }

    m_WritersWaiting += 1;
    while (!m_Counter.compareAndSwap(0, WRITE_LOCKED))
        Processor::pause();
    m_WritersWaiting -= 1;

    m_Writer = Processor::currentContext();
}

bool RwLock::tryAcquireWrite()
{
    if (!m_Counter.compareAndSwap(0, WRITE_LOCKED))
        return false;

    m_Writer = Processor::currentContext();
    return true;
}

void RwLock::releaseWrite()
{
    if (m_Writer != Processor::currentContext())
    {
        FATAL("RwLock: releaseWrite() by a context that does not hold it [this=" << Hex << reinterpret_cast<uintptr_t>(this) << "]");
    }

    m_Writer = 0;
    m_Counter = 0;
}

bool RwLock::tryUpgrade()
{
    if (m_Counter.compareAndSwap(1, WRITE_LOCKED))
    {
        m_Writer = Processor::currentContext();
        return true;
    }

    releaseRead();
    return false;
}

bool RwLock::isWriteLockedByCurrent() const
{
    return isWriteLocked() && m_Writer == Processor::currentContext();
}
