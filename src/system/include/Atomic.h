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

#ifndef KERNEL_ATOMIC_H
#define KERNEL_ATOMIC_H

#include <compiler.h>
#include <processor/types.h>

/** @addtogroup kernel
 * @{ */

// NOTE: See http://gcc.gnu.org/onlinedocs/gcc/_005f_005fatomic-Builtins.html
//       for more information about gcc's builtin atomic operations

/** Wrapper around gcc's builtin atomic operations. All operations are
 *  sequentially consistent. */
template<typename T>
class Atomic
{
  public:
    /** The constructor
     *\param[in] value initial value */
    inline Atomic(T value = T())
      : m_Atom(value){}
    /** The copy-constructor
     *\param[in] x reference object */
    inline Atomic(const Atomic &x)
      : m_Atom(x.load()){}
    /** The assignment operator
     *\param[in] x reference object */
    inline Atomic &operator = (const Atomic &x)
    {
      store(x.load());
      return *this;
    }
    /** Assign a new value
     *\param[in] x the new value */
    inline Atomic &operator = (T x)
    {
      store(x);
      return *this;
    }

    /** Addition
     *\param[in] x value to add
     *\return the value after the addition */
    inline T operator += (T x)
    {
      return __atomic_add_fetch(&m_Atom, x, __ATOMIC_SEQ_CST);
    }
    /** Subtraction
     *\param[in] x value to subtract
     *\return the value after the subtraction */
    inline T operator -= (T x)
    {
      return __atomic_sub_fetch(&m_Atom, x, __ATOMIC_SEQ_CST);
    }
    /** Compare and swap
     *\param[in] oldVal the comparision value
     *\param[in] newVal the new value
     *\return true, if the Atomic had the value oldVal and the value was changed to newVal, false otherwise */
    inline bool compareAndSwap(T oldVal, T newVal)
    {
      return __atomic_compare_exchange_n(&m_Atom, &oldVal, newVal, false,
                                         __ATOMIC_SEQ_CST, __ATOMIC_SEQ_CST);
    }
    /** Replace the value
     *\return the previous value */
    inline T exchange(T newVal)
    {
      return __atomic_exchange_n(&m_Atom, newVal, __ATOMIC_SEQ_CST);
    }
    /** Get the value */
    inline T load() const
    {
      return __atomic_load_n(&m_Atom, __ATOMIC_SEQ_CST);
    }
    /** Set the value */
    inline void store(T x)
    {
      __atomic_store_n(&m_Atom, x, __ATOMIC_SEQ_CST);
    }
    /** Get the value
     *\return the value of the Atomic */
    inline operator T () const
    {
      return load();
    }

  private:
    /** The atomic value */
    T m_Atom;
};

/** @} */

#endif
