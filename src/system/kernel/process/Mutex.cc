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

#include <process/Mutex.h>
#include <processor/Processor.h>
#include <Log.h>

Mutex::Mutex() : m_Locked(false), m_Owner(0)
{
}

Mutex::~Mutex()
{
    if (m_Locked)
        WARNING("Mutex destroyed while held [this=" << Hex << reinterpret_cast<uintptr_t>(this) << "]");
}

bool Mutex::acquire()
{
    uintptr_t context = Processor::currentContext();
    if (m_Owner == context)
    {
        FATAL("Mutex: recursive acquire [this=" << Hex << reinterpret_cast<uintptr_t>(this) << "]");
    }

    while (!m_Locked.compareAndSwap(false, true))
        Processor::pause();

    m_Owner = context;
    return true;
}

bool Mutex::tryAcquire()
{
    if (!m_Locked.compareAndSwap(false, true))
        return false;

    m_Owner = Processor::currentContext();
    return true;
}

void Mutex::release()
{
    if (m_Owner != Processor::currentContext())
    {
        FATAL("Mutex: release by a context that does not hold it [this=" << Hex << reinterpret_cast<uintptr_t>(this) << "]");
    }

    m_Owner = 0;
    m_Locked = false;
}

bool Mutex::isLockedByCurrent() const
{
    return m_Locked && m_Owner == Processor::currentContext();
}
