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

#ifndef KERNEL_MEMORY_CHUNKMAP_H
#define KERNEL_MEMORY_CHUNKMAP_H

#include <processor/types.h>
#include <utilities/HashTable.h>
#include <utilities/ObjectPool.h>
#include <Log.h>

/** @addtogroup kernelmemory
 * @{ */

/**
 * A sparse array of T pointers indexed by page number.
 *
 * Slots are grouped into fixed-size chunks which are created on first use
 * and kept in a hash table keyed by chunk number. An absent chunk reads as
 * a run of null slots.
 *
 * Chunks come from a pool supplied by the owner; when the pool is exhausted
 * ensureChunk() fails. The owner's lock serialises all access.
 */
template <class T>
class ChunkMap
{
    public:
        static const size_t slotsPerChunk = 16;
        static const size_t chunkShift = 4;

        static_assert((1UL << chunkShift) == slotsPerChunk,
                      "chunkShift must match slotsPerChunk");

        struct Chunk
        {
            T *slots[slotsPerChunk];
        };

        typedef ObjectPool<Chunk> ChunkPool;

    private:
        struct ChunkKey
        {
            ChunkKey() : index(0)
            {
            }

            ChunkKey(size_t i) : index(i)
            {
            }

            size_t hash() const
            {
                return index;
            }

            bool operator == (const ChunkKey &other) const
            {
                return index == other.index;
            }

            size_t index;
        };

    public:
        typedef typename HashTable<ChunkKey, Chunk>::Iterator Iterator;

        ChunkMap(ChunkPool *pPool = 0) : m_pPool(pPool), m_Chunks()
        {
        }

        ~ChunkMap()
        {
            clear();
        }

        /** Sets the pool chunks come from. Only valid while empty. */
        void setPool(ChunkPool *pPool)
        {
            if (m_Chunks.count())
                FATAL("ChunkMap::setPool: map is not empty");
            m_pPool = pPool;
        }

        static size_t chunkIndex(size_t index)
        {
            return index >> chunkShift;
        }

        static size_t chunkOffset(size_t index)
        {
            return index & (slotsPerChunk - 1);
        }

        /** Get the value stored at index, or null. */
        T *get(size_t index) const
        {
            Chunk *pChunk = m_Chunks.lookup(ChunkKey(chunkIndex(index)));
            if (!pChunk)
                return 0;
            return pChunk->slots[chunkOffset(index)];
        }

        /** Get the chunk holding index, creating it (null-filled) if needed.
         *\return the chunk, or null if the chunk pool is exhausted */
        Chunk *ensureChunk(size_t index)
        {
            ChunkKey key(chunkIndex(index));

            Chunk *pChunk = m_Chunks.lookup(key);
            if (pChunk)
                return pChunk;

            pChunk = m_pPool->allocate();
            if (!pChunk)
                return 0;

            for (size_t i = 0; i < slotsPerChunk; ++i)
                pChunk->slots[i] = 0;

            m_Chunks.insert(key, pChunk);
            return pChunk;
        }

        /** Stores value at index, whose chunk must already exist.
         *\return the value previously stored */
        T *set(size_t index, T *value)
        {
            Chunk *pChunk = m_Chunks.lookup(ChunkKey(chunkIndex(index)));
            if (!pChunk)
                FATAL("ChunkMap::set: no chunk for index " << index);

            T *old = pChunk->slots[chunkOffset(index)];
            pChunk->slots[chunkOffset(index)] = value;
            return old;
        }

        /** Clears the slot at index, handing the chunk back to the pool if it
         *  is now empty.
         *\return the value that was stored */
        T *take(size_t index)
        {
            ChunkKey key(chunkIndex(index));
            Chunk *pChunk = m_Chunks.lookup(key);
            if (!pChunk)
                return 0;

            T *old = pChunk->slots[chunkOffset(index)];
            pChunk->slots[chunkOffset(index)] = 0;

            for (size_t i = 0; i < slotsPerChunk; ++i)
            {
                if (pChunk->slots[i])
                    return old;
            }

            m_Chunks.remove(key);
            m_pPool->deallocate(pChunk);
            return old;
        }

        /** Returns every chunk to the pool. Values are not touched. */
        void clear()
        {
            for (Iterator it = m_Chunks.begin(); it != m_Chunks.end(); ++it)
                m_pPool->deallocate(*it);
            m_Chunks.clear();
        }

        size_t chunkCount() const
        {
            return m_Chunks.count();
        }

        /** Iterates over chunks in no particular order. */
        Iterator begin() const
        {
            return m_Chunks.begin();
        }

        Iterator end() const
        {
            return m_Chunks.end();
        }

        /** Index of the first slot of the chunk an iterator points at. */
        static size_t firstIndex(const Iterator &it)
        {
            return it.key().index << chunkShift;
        }

    private:
        NOT_COPYABLE_OR_ASSIGNABLE(ChunkMap);

        ChunkPool *m_pPool;
        HashTable<ChunkKey, Chunk> m_Chunks;
};

template <class T>
const size_t ChunkMap<T>::slotsPerChunk;
template <class T>
const size_t ChunkMap<T>::chunkShift;

/** @} */

#endif
