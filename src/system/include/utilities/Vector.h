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

#ifndef KERNEL_UTILITIES_VECTOR_H
#define KERNEL_UTILITIES_VECTOR_H

#include <processor/types.h>

/** @addtogroup kernelutilities
 * @{ */

/** A growable array of small values, kept in insertion order.
 *
 *  Elements are copied by assignment when the array grows or shifts, so T
 *  should be a pointer or a small value type. Address spaces keep their
 *  sorted entry pointers in one and insert or remove them by index. */
template<class T>
class Vector
{
    static_assert(sizeof(T) <= 16,
                  "Vector<T> should not be used with large objects");

public:
    typedef T*       Iterator;
    typedef T const* ConstIterator;

    Vector() : m_nCapacity(0), m_nCount(0), m_pData(0)
    {
    }

    /** Starts empty with room for capacity elements. */
    explicit Vector(size_t capacity) : m_nCapacity(0), m_nCount(0), m_pData(0)
    {
        reserve(capacity);
    }

    Vector(const Vector &other) : m_nCapacity(0), m_nCount(0), m_pData(0)
    {
        assign(other);
    }

    ~Vector()
    {
        delete [] m_pData;
    }

    Vector &operator = (const Vector &other)
    {
        if (&other != this)
            assign(other);
        return *this;
    }

    /** Element at index. Out of range yields a default-constructed T. */
    T &operator [](size_t index) const
    {
        static T outOfRange;
        if (index >= m_nCount)
        {
            outOfRange = T();
            return outOfRange;
        }
        return m_pData[index];
    }

    /** Number of elements storage exists for. */
    size_t capacity() const
    {
        return m_nCapacity;
    }

    size_t count() const
    {
        return m_nCount;
    }

    void pushBack(T value)
    {
        reserve(m_nCount + 1);
        m_pData[m_nCount++] = value;
    }

    T popBack()
    {
        return m_pData[--m_nCount];
    }

    /** Places value at index, moving later elements up by one. An index at
     *  or past count() appends. */
    void insert(size_t index, T value)
    {
        if (index > m_nCount)
            index = m_nCount;

        reserve(m_nCount + 1);
        for (size_t i = m_nCount; i > index; --i)
            m_pData[i] = m_pData[i - 1];
        m_pData[index] = value;
        ++m_nCount;
    }

    /** Takes the element at index out and returns it. */
    T remove(size_t index)
    {
        T value = m_pData[index];
        erase(m_pData + index);
        return value;
    }

    Iterator erase(Iterator iter)
    {
        for (Iterator it = iter; it + 1 < end(); ++it)
            *it = *(it + 1);
        --m_nCount;
        return iter;
    }

    /** Drops every element and releases the storage. */
    void clear()
    {
        delete [] m_pData;
        m_pData = 0;
        m_nCapacity = m_nCount = 0;
    }

    Iterator begin()
    {
        return m_pData;
    }
    ConstIterator begin() const
    {
        return m_pData;
    }
    Iterator end()
    {
        return m_pData + m_nCount;
    }
    ConstIterator end() const
    {
        return m_pData + m_nCount;
    }

    /** Makes this an element-wise copy of other. */
    void assign(const Vector &other)
    {
        m_nCount = 0;
        reserve(other.m_nCount);
        for (size_t i = 0; i < other.m_nCount; ++i)
            m_pData[i] = other.m_pData[i];
        m_nCount = other.m_nCount;
    }

    /** Ensures room for at least capacity elements, keeping the current
     *  contents. Growth at least doubles the storage. */
    void reserve(size_t capacity)
    {
        if (capacity <= m_nCapacity)
            return;
        if (capacity < m_nCapacity * 2)
            capacity = m_nCapacity * 2;

        T *pData = new T[capacity];
        for (size_t i = 0; i < m_nCount; ++i)
            pData[i] = m_pData[i];
        delete [] m_pData;

        m_pData = pData;
        m_nCapacity = capacity;
    }

private:
    size_t m_nCapacity;
    size_t m_nCount;
    T *m_pData;
};

/** @} */

#endif
