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

#ifndef KERNEL_MEMORY_CONFIG_H
#define KERNEL_MEMORY_CONFIG_H

/** @addtogroup kernelmemory
 * @{ */

/** Capacity of an address space's name, including the terminator. */
#ifndef ADDRESS_SPACE_NAME_LENGTH
#define ADDRESS_SPACE_NAME_LENGTH 32
#endif

/** Number of times a page fault may restart before it is considered to
 *  be livelocked. */
#ifndef FAULT_RESTART_LIMIT
#define FAULT_RESTART_LIMIT 64
#endif

/** Number of freed objects an ObjectPool keeps for reuse. */
#ifndef OBJECT_POOL_SIZE
#define OBJECT_POOL_SIZE 16
#endif

/** Largest object an ObjectPool will hand out. */
#ifndef SMALL_OBJECT_SIZE
#define SMALL_OBJECT_SIZE 512
#endif

/** @} */

#endif
