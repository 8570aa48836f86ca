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

#include <Spinlock.h>
#include <processor/Processor.h>
#include <Log.h>
#include <panic.h>

bool Spinlock::acquire()
{
  if (m_Magic != 0xdeadbaba)
  {
      FATAL_NOLOCK("Wrong magic in acquire [" << Hex << m_Magic << "] [this=" << reinterpret_cast<uintptr_t>(this) << "]");
  }

  uintptr_t context = Processor::currentContext();

  while (m_Atom.compareAndSwap(true, false) == false)
  {
    // Spinning on a lock we already hold will never terminate.
    if (m_Owner == context)
    {
      uintptr_t myra = reinterpret_cast<uintptr_t>(__builtin_return_address(0));
      ERROR_NOLOCK("Spinlock has deadlocked in acquire");
      ERROR_NOLOCK(" -> my return address is " << Hex << myra);
      panic("Spinlock has deadlocked");
    }

    Processor::pause();
  }

  m_Owner = context;

  return true;
}

bool Spinlock::tryAcquire()
{
  if (!m_Atom.compareAndSwap(true, false))
    return false;

  m_Owner = Processor::currentContext();
  return true;
}

void Spinlock::release()
{
  if (m_Magic != 0xdeadbaba)
  {
      FATAL_NOLOCK("Wrong magic in release.");
  }

  m_Owner = 0;

  if (m_Atom.compareAndSwap(false, true) == false)
  {
    FATAL_NOLOCK("Spinlock: release() called on an unlocked spinlock [this=" << Hex << reinterpret_cast<uintptr_t>(this) << "]");
  }
}
