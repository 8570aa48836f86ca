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

#ifndef KERNEL_LOCKGUARD_H
#define KERNEL_LOCKGUARD_H

#include <compiler.h>
#include <Log.h>

/** @addtogroup kernel
 * @{ */

template<class T>
class LockGuard
{
  public:
    inline LockGuard(T &Lock, bool Condition = true)
      : m_Lock(Lock), m_bCondition(Condition)
    {
      if (m_bCondition)
        m_Lock.acquire();
    }
    inline virtual ~LockGuard()
    {
      if (m_bCondition)
        m_Lock.release();
    }

  private:
    LockGuard() = delete;
    NOT_COPYABLE_OR_ASSIGNABLE(LockGuard);

    T &m_Lock;
    bool m_bCondition;
};

template<class T> class WriteLockGuard;

/**
 * Holds the read side of an object's RwLock. T must provide getLock()
 * returning the RwLock that guards it.
 *
 * Functions that need the caller to hold the object's lock take one of
 * these guards, so the requirement is checked by the compiler.
 */
template<class T>
class ReadLockGuard
{
  friend class WriteLockGuard<T>;

  public:
    explicit ReadLockGuard(T &object)
      : m_Object(object), m_bHeld(true), m_bUpgraded(false)
    {
      m_Object.getLock().acquireRead();
    }
    ~ReadLockGuard()
    {
      release();
    }

    /** Drops the lock early. */
    void release()
    {
      if (!m_bHeld)
        return;

      if (m_bUpgraded)
        m_Object.getLock().releaseWrite();
      else
        m_Object.getLock().releaseRead();
      m_bHeld = false;
    }

    /** Attempts to upgrade to a write lock, which a WriteLockGuard can then
     *  adopt. If another reader is present the lock is released and false is
     *  returned; the caller must start over. */
    bool tryUpgrade()
    {
      if (!m_bHeld || m_bUpgraded)
        return m_bUpgraded;

      if (m_Object.getLock().tryUpgrade())
      {
        m_bUpgraded = true;
        return true;
      }

      m_bHeld = false;
      return false;
    }

    T &object() const
    {
      return m_Object;
    }

  private:
    ReadLockGuard() = delete;
    NOT_COPYABLE_OR_ASSIGNABLE(ReadLockGuard);

    T &m_Object;
    bool m_bHeld;
    bool m_bUpgraded;
};

/**
 * Holds the write side of an object's RwLock. Reference counts and other
 * state that requires exclusive access are only reachable through one of
 * these.
 */
template<class T>
class WriteLockGuard
{
  public:
    explicit WriteLockGuard(T &object)
      : m_Object(object), m_bHeld(true)
    {
      m_Object.getLock().acquireWrite();
    }

    /** Adopts a read guard that was successfully upgraded. */
    explicit WriteLockGuard(ReadLockGuard<T> &upgraded)
      : m_Object(upgraded.m_Object), m_bHeld(true)
    {
      if (!upgraded.m_bHeld || !upgraded.m_bUpgraded)
      {
        FATAL("WriteLockGuard: adopting a lock that was not upgraded");
      }
      upgraded.m_bHeld = false;
    }

    ~WriteLockGuard()
    {
      release();
    }

    /** Drops the lock early. Functions that "unlock on return" call this on
     *  the guard they were handed. */
    void release()
    {
      if (!m_bHeld)
        return;

      m_Object.getLock().releaseWrite();
      m_bHeld = false;
    }

    bool held() const
    {
      return m_bHeld;
    }

    T &object() const
    {
      return m_Object;
    }

  private:
    WriteLockGuard() = delete;
    NOT_COPYABLE_OR_ASSIGNABLE(WriteLockGuard);

    T &m_Object;
    bool m_bHeld;
};

/** @} */

#endif
