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

#include <Log.h>
#include <panic.h>
#include <LockGuard.h>

Log Log::m_Instance;

/** Prefix for each severity, indexed by SeverityLevel. */
static const char *g_SeverityTags[] =
{
    "(DD) ",
    "(NN) ",
    "(WW) ",
    "(EE) ",
    "(FF) "
};

Log::Log () :
#ifdef THREADS
    m_Lock(),
#endif
    m_nBacklogHead(0),
    m_nBacklog(0),
    m_Pending(),
    m_NumberType(Dec),
    m_CallbackLevel(Debug),
    m_OutputCallbacks()
{
}

Log::~Log ()
{
}

void Log::format(const LogEntry &entry, HugeStaticString &str)
{
    str = g_SeverityTags[entry.type];
    str += entry.str;
    str += "\n";
}

void Log::installCallback(LogCallback *pCallback, bool bSkipBacklog)
{
#ifdef THREADS
    LockGuard<Spinlock> guard(m_Lock);
#endif
    m_OutputCallbacks.pushBack(pCallback);

    if (bSkipBacklog)
        return;

    HugeStaticString str;
    for (size_t n = 0; n < m_nBacklog; ++n)
    {
        const LogEntry &entry = getBacklogEntry(n);
        if (entry.type < m_CallbackLevel && entry.type != Fatal)
            continue;
        format(entry, str);
        pCallback->callback(str);
    }
}

void Log::removeCallback(LogCallback *pCallback)
{
#ifdef THREADS
    LockGuard<Spinlock> guard(m_Lock);
#endif
    for (size_t i = 0; i < m_OutputCallbacks.count(); ++i)
    {
        if (m_OutputCallbacks[i] != pCallback)
            continue;
        m_OutputCallbacks.erase(m_OutputCallbacks.begin() + i);
        return;
    }
}

Log &Log::operator<< (const char *str)
{
    m_Pending.str.append(str);
    return *this;
}

Log &Log::operator<< (bool b)
{
    return *this << (b ? "true" : "false");
}

template<class T>
Log &Log::operator << (T n)
{
    size_t radix = 10;
    if (m_NumberType == Hex)
    {
        radix = 16;
        m_Pending.str.append("0x");
    }

    if (n < 0)
    {
        m_Pending.str.append("-");
        // Negate unsigned so the most negative value survives.
        m_Pending.str.append(0 - static_cast<uint64_t>(n), radix);
    }
    else
        m_Pending.str.append(static_cast<uint64_t>(n), radix);
    return *this;
}

template Log &Log::operator << (char);
template Log &Log::operator << (unsigned char);
template Log &Log::operator << (short);
template Log &Log::operator << (unsigned short);
template Log &Log::operator << (int);
template Log &Log::operator << (unsigned int);
template Log &Log::operator << (long);
template Log &Log::operator << (unsigned long);
template Log &Log::operator << (long long);
template Log &Log::operator << (unsigned long long);

Log &Log::operator<< (SeverityLevel level)
{
    m_Pending.str.clear();
    m_Pending.type = level;
    m_NumberType = Dec;

    return *this;
}

Log &Log::operator<< (NumberType type)
{
    m_NumberType = type;
    return *this;
}

const Log::LogEntry &Log::commit()
{
    LogEntry &slot = m_Backlog[m_nBacklogHead];
    slot = m_Pending;
    m_nBacklogHead = (m_nBacklogHead + 1) % LOG_BACKLOG;
    if (m_nBacklog < LOG_BACKLOG)
        ++m_nBacklog;
    return slot;
}

Log &Log::operator<< (Modifier type)
{
    static bool bInFatal = false;

    if (type != Flush)
        return *this;

    const LogEntry &entry = commit();

    bool bDeliver = entry.type >= m_CallbackLevel || entry.type == Fatal;
    if (bDeliver && m_OutputCallbacks.count())
    {
        HugeStaticString str;
        format(entry, str);
        for (size_t i = 0; i < m_OutputCallbacks.count(); ++i)
        {
            if (m_OutputCallbacks[i])
                m_OutputCallbacks[i]->callback(static_cast<const char*>(str));
        }
    }

    // A fatal entry raised while panicking must not recurse.
    if (entry.type == Fatal && !bInFatal)
    {
        bInFatal = true;
#ifdef THREADS
        if (m_Lock.acquired())
            m_Lock.release();
#endif
        panic(static_cast<const char*>(entry.str));
    }

    return *this;
}

Log::LogCallback::~LogCallback()
{
}
