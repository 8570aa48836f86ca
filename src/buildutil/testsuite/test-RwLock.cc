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

#define KEEL_EXTERNAL_SOURCE 1

#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include <utilities/RwLock.h>
#include <process/Mutex.h>
#include <Spinlock.h>
#include <LockGuard.h>

class Guarded
{
    public:
        Guarded() : value(0)
        {
        }

        RwLock &getLock()
        {
            return m_Lock;
        }

        int value;

    private:
        RwLock m_Lock;
};

TEST(KeelRwLock, ManyReaders)
{
    RwLock lock;
    lock.acquireRead();
    EXPECT_TRUE(lock.tryAcquireRead());
    EXPECT_TRUE(lock.isReadLocked());
    EXPECT_FALSE(lock.tryAcquireWrite());
    lock.releaseRead();
    lock.releaseRead();
    EXPECT_FALSE(lock.isReadLocked());
}

TEST(KeelRwLock, WriterExcludesReaders)
{
    RwLock lock;
    lock.acquireWrite();
    EXPECT_TRUE(lock.isWriteLocked());
    EXPECT_TRUE(lock.isWriteLockedByCurrent());
    EXPECT_FALSE(lock.tryAcquireRead());
    EXPECT_FALSE(lock.tryAcquireWrite());
    lock.releaseWrite();
    EXPECT_TRUE(lock.tryAcquireRead());
    lock.releaseRead();
}

TEST(KeelRwLock, UpgradeSoleReader)
{
    RwLock lock;
    lock.acquireRead();
    EXPECT_TRUE(lock.tryUpgrade());
    EXPECT_TRUE(lock.isWriteLocked());
    lock.releaseWrite();
}

TEST(KeelRwLock, UpgradeWithOtherReaderReleases)
{
    RwLock lock;
    lock.acquireRead();
    lock.acquireRead();

    EXPECT_FALSE(lock.tryUpgrade());

    // Only the other reader is left.
    EXPECT_TRUE(lock.isReadLocked());
    lock.releaseRead();
    EXPECT_FALSE(lock.isReadLocked());
}

TEST(KeelRwLockDeathTest, ReleaseUnheldRead)
{
    RwLock lock;
    EXPECT_DEATH(lock.releaseRead(), "releaseRead");
}

TEST(KeelRwLock, ReadGuardUpgradeAdoptedByWriteGuard)
{
    Guarded object;
    {
        ReadLockGuard<Guarded> readGuard(object);
        ASSERT_TRUE(readGuard.tryUpgrade());

        WriteLockGuard<Guarded> writeGuard(readGuard);
        EXPECT_TRUE(writeGuard.held());
        writeGuard.object().value = 5;
    }

    EXPECT_FALSE(object.getLock().isWriteLocked());
    EXPECT_FALSE(object.getLock().isReadLocked());
    EXPECT_EQ(object.value, 5);
}

TEST(KeelRwLock, FailedGuardUpgradeHoldsNothing)
{
    Guarded object;
    ReadLockGuard<Guarded> other(object);
    {
        ReadLockGuard<Guarded> readGuard(object);
        EXPECT_FALSE(readGuard.tryUpgrade());
    }
    EXPECT_TRUE(object.getLock().isReadLocked());
    other.release();
    EXPECT_FALSE(object.getLock().isReadLocked());
}

TEST(KeelRwLock, WriteGuardEarlyRelease)
{
    Guarded object;
    WriteLockGuard<Guarded> guard(object);
    guard.release();
    EXPECT_FALSE(guard.held());
    EXPECT_FALSE(object.getLock().isWriteLocked());
}

TEST(KeelRwLock, ConcurrentWriters)
{
    Guarded object;
    const int threads = 4;
    const int iterations = 10000;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t)
    {
        workers.push_back(std::thread([&object, iterations]() {
            for (int i = 0; i < iterations; ++i)
            {
                WriteLockGuard<Guarded> guard(object);
                ++object.value;
            }
        }));
    }

    for (size_t t = 0; t < workers.size(); ++t)
        workers[t].join();

    EXPECT_EQ(object.value, threads * iterations);
}

TEST(KeelMutex, AcquireRelease)
{
    Mutex mutex;
    EXPECT_TRUE(mutex.acquire());
    EXPECT_TRUE(mutex.isLocked());
    EXPECT_TRUE(mutex.isLockedByCurrent());
    EXPECT_FALSE(mutex.tryAcquire());
    mutex.release();
    EXPECT_FALSE(mutex.isLocked());
}

TEST(KeelMutex, LockGuard)
{
    Mutex mutex;
    {
        LockGuard<Mutex> guard(mutex);
        EXPECT_TRUE(mutex.isLocked());
    }
    EXPECT_FALSE(mutex.isLocked());
}

TEST(KeelSpinlock, AcquireRelease)
{
    Spinlock lock;
    EXPECT_TRUE(lock.acquire());
    EXPECT_TRUE(lock.acquired());
    lock.release();
    EXPECT_FALSE(lock.acquired());
}
