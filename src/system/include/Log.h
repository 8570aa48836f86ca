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

#ifndef KERNEL_LOG_H
#define KERNEL_LOG_H

#ifdef THREADS
#include <Spinlock.h>
#endif
#include <processor/types.h>
#include <utilities/Vector.h>
#include <utilities/StaticString.h>
#include <panic.h>

/** @addtogroup kernel
 * @{ */

/** Writes one entry at the given severity. The stream expression in text is
 *  evaluated with the log lock held unless lock is zero. */
#ifdef THREADS
#define LOG_AT_LEVEL(level, text, lock) \
  do \
  { \
    if (lock) \
      Log::instance().m_Lock.acquire(); \
    Log::instance() << level << text << Flush; \
    if (lock) \
      Log::instance().m_Lock.release(); \
  } \
  while (0)
#else
#define LOG_AT_LEVEL(level, text, lock) \
  do { Log::instance() << level << text << Flush; } while (0)
#endif

#ifdef DEBUG_LOGGING
#define DEBUG_LOG(text) LOG_AT_LEVEL(Log::Debug, text, 1)
#else
#define DEBUG_LOG(text)
#endif

#define NOTICE(text) LOG_AT_LEVEL(Log::Notice, text, 1)
#define WARNING(text) LOG_AT_LEVEL(Log::Warning, text, 1)
#define ERROR(text) LOG_AT_LEVEL(Log::Error, text, 1)
/** Flushing a fatal entry panics, so FATAL never returns. */
#define FATAL(text) do { LOG_AT_LEVEL(Log::Fatal, text, 1); while(1); } while(0)

/** For callers that may already hold the log lock (the spinlock itself). */
#define ERROR_NOLOCK(text) LOG_AT_LEVEL(Log::Error, text, 0)
#define FATAL_NOLOCK(text) do { LOG_AT_LEVEL(Log::Fatal, text, 0); while(1); } while(0)

/** Capacity of one log entry's text. */
#define LOG_LENGTH  128
/** Number of entries the backlog holds before the oldest is overwritten. */
#define LOG_BACKLOG 512

/** Radix for integers written to the log. Every entry starts in Dec. */
enum NumberType
{
  Hex,
  Dec
};

/** Stream modifiers */
enum Modifier
{
  /** Ends the current entry, stores it and hands it to the callbacks. */
  Flush
};

/** The kernel log.
 *
 *  Entries are built up with operator<< between a severity level and Flush,
 *  kept in a fixed backlog and handed, formatted as "(NN) text\n", to every
 *  installed callback. Nothing here allocates once the callback list exists,
 *  so the log is usable from the allocation paths it reports on.
 *\note Use the NOTICE, WARNING, ERROR and FATAL macros rather than streaming
 *      into instance() directly. */
class Log
{
public:

  /** Receives every flushed entry. */
  class LogCallback
  {
    public:
      virtual void callback(const char *) = 0;

      virtual ~LogCallback();
  };

  enum SeverityLevel
  {
    Debug = 0,
    Notice,
    Warning,
    Error,
    Fatal
  };

  /** One flushed line. */
  struct LogEntry
  {
    inline LogEntry()
     : type(Notice), str(){}

    SeverityLevel type;
    StaticString<LOG_LENGTH> str;
  };

#ifdef THREADS
  /** Taken by the logging macros around a whole entry. */
  Spinlock m_Lock;
#endif

  inline static Log &instance()
    {return m_Instance;}

  /** Installs an output callback. Unless bSkipBacklog is set the callback
   *  first receives every entry still in the backlog, oldest first. */
  void installCallback(LogCallback *pCallback, bool bSkipBacklog=false);

  void removeCallback(LogCallback *pCallback);

  /** Entries below level are still kept in the backlog but are no longer
   *  passed to callbacks. Fatal entries are always delivered. */
  void setCallbackLevel(SeverityLevel level)
    {m_CallbackLevel = level;}
  SeverityLevel getCallbackLevel() const
    {return m_CallbackLevel;}

  Log &operator<< (const char *str);
  inline Log &operator<< (char *str)
    {return (*this) << (static_cast<const char*>(str));}
  template<unsigned int N>
  Log &operator<< (const StaticString<N> &str)
    {return (*this) << static_cast<const char*>(str);}
  Log &operator<< (bool b);
  /** Pointers are written as their address. */
  template<class T>
  Log &operator<< (T *p)
    {return (*this) << (reinterpret_cast<uintptr_t>(p));}
  /** Integers, in the current radix. Only instantiated for integer types. */
  template<class T>
  Log &operator << (T n);

  /** Begins a new entry, discarding anything not yet flushed. */
  Log &operator<< (SeverityLevel level);
  Log &operator<< (NumberType type);
  Log &operator<< (Modifier type);

  /** Number of entries currently held in the backlog. */
  inline size_t getBacklogSize() const
    {return m_nBacklog;}

  /** The n'th backlog entry, 0 being the oldest still held. */
  inline const LogEntry &getBacklogEntry(size_t n) const
    {return m_Backlog[(m_nBacklogHead + LOG_BACKLOG - m_nBacklog + n) % LOG_BACKLOG];}

  inline const LogEntry &getLatestEntry() const
    {return getBacklogEntry(m_nBacklog - 1);}

private:
  Log();
  ~Log();
  Log(const Log &);
  Log &operator = (const Log &);

  /** Renders entry as the line handed to callbacks. */
  static void format(const LogEntry &entry, HugeStaticString &str);

  /** Stores the pending entry and returns the slot it landed in. */
  const LogEntry &commit();

  LogEntry m_Backlog[LOG_BACKLOG];
  /** Slot the next entry is written to. */
  size_t m_nBacklogHead;
  size_t m_nBacklog;

  /** The entry being built by operator<<. */
  LogEntry m_Pending;

  NumberType m_NumberType;

  SeverityLevel m_CallbackLevel;

  Vector<LogCallback*> m_OutputCallbacks;

  static Log m_Instance;
};

/** @} */

#endif
