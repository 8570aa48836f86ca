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

#include <memory/AnonymousPage.h>
#include <memory/AddressSpaceCaches.h>
#include <Log.h>

AnonymousPage::AnonymousPage() : m_Lock(), m_ReferenceCount(0), m_PhysicalPage(0)
{
}

AnonymousPage *AnonymousPage::create(AddressSpaceCaches &caches, physical_uintptr_t page)
{
    AnonymousPage *pPage = caches.anonymousPages.allocate();
    if (!pPage)
        return 0;

    pPage->m_ReferenceCount = 1;
    pPage->m_PhysicalPage = page;
    return pPage;
}

void AnonymousPage::incrementReferenceCount(WriteLockGuard<AnonymousPage> &guard)
{
    AnonymousPage &page = guard.object();
    if (!page.m_ReferenceCount)
        FATAL("AnonymousPage: reference taken on a dead page " << Hex << page.m_PhysicalPage);

    ++page.m_ReferenceCount;
}

void AnonymousPage::decrementReferenceCount(WriteLockGuard<AnonymousPage> &guard,
                                            AddressSpaceCaches &caches)
{
    AnonymousPage &page = guard.object();
    if (!page.m_ReferenceCount)
        FATAL("AnonymousPage: reference dropped on a dead page " << Hex << page.m_PhysicalPage);

    size_t referenceCount = --page.m_ReferenceCount;
    guard.release();

    if (referenceCount)
        return;

    caches.physicalMemory.freePage(page.m_PhysicalPage);
    page.m_PhysicalPage = 0;
    caches.anonymousPages.deallocate(&page);
}
