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

#ifndef KERNEL_UTILITY_OBJECT_POOL_H
#define KERNEL_UTILITY_OBJECT_POOL_H

#include <processor/types.h>
#ifdef THREADS
#include <Spinlock.h>
#include <LockGuard.h>
#endif
#include <utilities/Vector.h>
#include <memory/config.h>

/**
 * ObjectPool manages a set of objects for rapid allocation and deallocation,
 * which is particularly useful for objects which are used frequently (e.g.
 * address space entries).
 *
 * If no objects are available (none have been deallocated yet), new objects
 * are allocated from the heap. Objects handed out may have been used
 * before: callers reinitialise every field they rely on.
 *
 * A pool can be given a limit on the number of live objects, beyond which
 * allocation fails and returns null. This is how slab exhaustion reaches
 * the callers as an out-of-memory condition.
 */
template <class T, size_t poolSize = OBJECT_POOL_SIZE>
class ObjectPool
{
    static_assert(sizeof(T) <= SMALL_OBJECT_SIZE,
                  "ObjectPool<T> only serves small objects");

    public:
        ObjectPool(size_t limit = 0) : m_Pool(poolSize), m_nLive(0), m_Limit(limit)
#ifdef THREADS
            , m_Spinlock()
#endif
        {
        }

        virtual ~ObjectPool()
        {
            while (m_Pool.count())
                delete m_Pool.popBack();
        }

        /** Allocate one object.
         *\return the object, or null if the pool's limit has been reached */
        T *allocate()
        {
#ifdef THREADS
            LockGuard<Spinlock> guard(m_Spinlock);
#endif

            return allocateUnlocked();
        }

        /** Allocate count objects into pObjects. Either all of them are
         *  allocated or none are.
         *\return true if every object was allocated */
        bool allocateMany(T **pObjects, size_t count)
        {
#ifdef THREADS
            LockGuard<Spinlock> guard(m_Spinlock);
#endif

            if (m_Limit && (m_nLive + count) > m_Limit)
                return false;

            for (size_t i = 0; i < count; ++i)
                pObjects[i] = allocateUnlocked();
            return true;
        }

        void deallocate(T *object)
        {
#ifdef THREADS
            LockGuard<Spinlock> guard(m_Spinlock);
#endif

            --m_nLive;

            // Keep at most poolSize spare objects around.
            if (m_Pool.count() < poolSize)
                m_Pool.pushBack(object);
            else
                delete object;
        }

        /** Number of objects currently handed out. */
        size_t live() const
        {
            return m_nLive;
        }

        /** Change the live-object limit. Zero removes the limit. */
        void setLimit(size_t limit)
        {
            m_Limit = limit;
        }

    private:
        T *allocateUnlocked()
        {
            if (m_Limit && m_nLive >= m_Limit)
                return 0;

            ++m_nLive;

            if (m_Pool.count())
                return m_Pool.popBack();
            return new T;
        }

        Vector<T *> m_Pool;
        size_t m_nLive;
        size_t m_Limit;
#ifdef THREADS
        Spinlock m_Spinlock;
#endif
};

#endif  // KERNEL_UTILITY_OBJECT_POOL_H
