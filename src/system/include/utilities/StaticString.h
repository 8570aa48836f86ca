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

#ifndef KERNEL_UTILITIES_STATICSTRING_H
#define KERNEL_UTILITIES_STATICSTRING_H

#include <processor/types.h>
#include <string.h>

/** @addtogroup kernelutilities
 * @{ */

/** A NUL-terminated string in a fixed N byte buffer, so building one never
 *  allocates. Anything beyond N - 1 characters is silently dropped. */
template<unsigned int N>
class StaticString
{
public:
    StaticString() : m_Length(0)
    {
        m_Data[0] = '\0';
    }

    /** Copies pSrc, truncating to fit. */
    explicit StaticString(const char *pSrc) : m_Length(0)
    {
        m_Data[0] = '\0';
        append(pSrc);
    }

    operator const char*() const
    {
        return m_Data;
    }

    template<unsigned int N2>
    StaticString &operator += (const StaticString<N2> &str)
    {
        append(static_cast<const char *>(str));
        return *this;
    }

    StaticString &operator += (const char *str)
    {
        append(str);
        return *this;
    }

    StaticString &operator = (const char *str)
    {
        clear();
        append(str);
        return *this;
    }

    bool operator == (const char *pStr) const
    {
        return strcmp(m_Data, pStr) == 0;
    }

    void clear()
    {
        m_Length = 0;
        m_Data[0] = '\0';
    }

    void append(const char *str)
    {
        for (; *str && !full(); ++str)
            m_Data[m_Length++] = *str;
        m_Data[m_Length] = '\0';
    }

    /** Appends n in the given radix (2 to 16), lower-case, without prefix. */
    void append(uint64_t n, size_t radix = 10)
    {
        static const char digits[] = "0123456789abcdef";

        // Digits come out least significant first.
        char reversed[64];
        size_t count = 0;
        do
        {
            reversed[count++] = digits[n % radix];
            n /= radix;
        } while (n);

        while (count && !full())
            m_Data[m_Length++] = reversed[--count];
        m_Data[m_Length] = '\0';
    }

    /** Appends count copies of c, for indenting dumps. */
    void pad(size_t count, char c = ' ')
    {
        while (count-- && !full())
            m_Data[m_Length++] = c;
        m_Data[m_Length] = '\0';
    }

    size_t length() const
    {
        return m_Length;
    }

private:
    bool full() const
    {
        return m_Length >= N - 1;
    }

    char m_Data[N];
    size_t m_Length;
};

typedef StaticString<64>   NormalStaticString;
typedef StaticString<1024> HugeStaticString;

/** @} */

#endif
