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

#ifndef KERNEL_UTILITIES_HASHTABLE_H
#define KERNEL_UTILITIES_HASHTABLE_H

#include <processor/types.h>
#include <compiler.h>

/** @addtogroup kernelutilities
 * @{ */

/**
 * Hash table class.
 *
 * Handles hash collisions by chaining keys.
 *
 * The bucket array is lazily created, so if an insertion is never done,
 * the instance will not consume any additional memory.
 *
 * The key type 'K' should have a method hash() which returns a
 * size_t hash; it is reduced modulo the bucket count.
 *
 * The key type 'K' should also be able to compare against other 'K'
 * types for equality.
 *
 * Values are stored by pointer and are not owned by the table.
 */
template<class K, class V>
class HashTable
{
    private:
        struct bucket {
            bucket() : key(), value(0), next(0)
            {
            }

            K key;
            V *value;

            // Where hash collisions occur, we chain another value
            // to the original bucket.
            bucket *next;
        };

    public:
        /** Forward iterator over the stored values. */
        class Iterator
        {
            friend class HashTable;
            public:
                Iterator &operator ++ ()
                {
                    if (m_pBucket)
                        m_pBucket = m_pBucket->next;
                    if (!m_pBucket)
                    {
                        ++m_Index;
                        settle();
                    }
                    return *this;
                }

                bool operator != (const Iterator &other) const
                {
                    return m_pBucket != other.m_pBucket;
                }

                bool operator == (const Iterator &other) const
                {
                    return m_pBucket == other.m_pBucket;
                }

                V *operator * () const
                {
                    return m_pBucket->value;
                }

                const K &key() const
                {
                    return m_pBucket->key;
                }

            private:
                Iterator(const HashTable *pTable, size_t index) :
                    m_pTable(pTable), m_Index(index), m_pBucket(0)
                {
                    settle();
                }

                /** Moves forward to the first non-empty chain at or after
                 *  m_Index. */
                void settle()
                {
                    if (!m_pTable->m_Buckets)
                        return;
                    while (!m_pBucket && m_Index < m_pTable->m_nBuckets)
                    {
                        m_pBucket = m_pTable->m_Buckets[m_Index];
                        if (!m_pBucket)
                            ++m_Index;
                    }
                }

                const HashTable *m_pTable;
                size_t m_Index;
                bucket *m_pBucket;
        };

        /**
         * To determine how many buckets you need, estimate the number of
         * keys that will be live at once.
         */
        HashTable(size_t numbuckets = 16) :
            m_Buckets(0), m_nBuckets(numbuckets ? numbuckets : 1), m_nCount(0)
        {
        }

        virtual ~HashTable() {
            clear();
        }

        /**
         * Do a lookup of the given key, and return either the value,
         * or NULL if the key is not in the hashtable.
         *
         * O(1) in the average case, with a hash function that rarely
         * collides.
         */
        V *lookup(const K &k) const {
            // No buckets yet?
            if(!m_Buckets) {
                return 0;
            }

            bucket *b = m_Buckets[k.hash() % m_nBuckets];
            while (b)
            {
                if (b->key == k)
                    return b->value;
                b = b->next;
            }

            return 0;
        }

        /**
         * Insert the given value with the given key.
         *
         * \return false if the key is already present.
         */
        bool insert(const K &k, V *v) {
            // If this exact key already exists, we have more than
            // just a hash collision, and we must fail.
            if(lookup(k) != 0) {
                return false;
            }

            // Lazily create buckets if needed.
            if(!m_Buckets) {
                m_Buckets = new bucket*[m_nBuckets];
                for (size_t i = 0; i < m_nBuckets; ++i)
                    m_Buckets[i] = 0;
            }

            size_t hash = k.hash() % m_nBuckets;

            bucket *newb = new bucket;
            newb->key = k;
            newb->value = v;
            newb->next = m_Buckets[hash];
            m_Buckets[hash] = newb;

            ++m_nCount;
            return true;
        }

        /**
         * Remove the given key.
         *
         * \return the value that was stored, or NULL if none was.
         */
        V *remove(const K &k) {
            if(!m_Buckets) {
                return 0;
            }

            size_t hash = k.hash() % m_nBuckets;

            bucket *prev = 0;
            bucket *b = m_Buckets[hash];
            while (b)
            {
                if (b->key == k)
                {
                    if (prev)
                        prev->next = b->next;
                    else
                        m_Buckets[hash] = b->next;

                    V *value = b->value;
                    delete b;
                    --m_nCount;
                    return value;
                }

                prev = b;
                b = b->next;
            }

            return 0;
        }

        /** Removes every key. Values are not touched. */
        void clear() {
            if(m_Buckets) {
                for (size_t i = 0; i < m_nBuckets; ++i)
                {
                    bucket *b = m_Buckets[i];
                    while (b)
                    {
                        bucket *d = b;
                        b = b->next;
                        delete d;
                    }
                }

                delete [] m_Buckets;
                m_Buckets = 0;
            }

            m_nCount = 0;
        }

        size_t count() const {
            return m_nCount;
        }

        Iterator begin() const {
            return Iterator(this, 0);
        }

        Iterator end() const {
            return Iterator(this, m_nBuckets);
        }

    private:
        NOT_COPYABLE_OR_ASSIGNABLE(HashTable);

        bucket **m_Buckets;
        size_t m_nBuckets;
        size_t m_nCount;
};

/** @} */

#endif
