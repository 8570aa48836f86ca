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

#ifndef KERNEL_PROCESSOR_HOSTED_TYPES_H
#define KERNEL_PROCESSOR_HOSTED_TYPES_H

/** @addtogroup kernelprocessorhosted
 * @{ */

#include <stdint.h>
#include <stddef.h>
#include <sys/types.h>

/** Physical addresses are offsets into the hosted RAM pool. */
typedef uintptr_t HOSTEDphysical_uintptr_t;

/** Default size of one physical page. The hosted page table and physical
 *  memory manager can be built with a smaller page for tests. */
#ifndef PAGE_SIZE
#define PAGE_SIZE 4096
#endif

/** @} */

#endif
