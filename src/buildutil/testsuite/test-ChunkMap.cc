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

#include <gtest/gtest.h>

#include <memory/ChunkMap.h>

typedef ChunkMap<int> IntChunkMap;

TEST(KeelChunkMap, EmptyReadsNull)
{
    IntChunkMap::ChunkPool pool;
    IntChunkMap map(&pool);

    EXPECT_EQ(map.get(0), (int *) 0);
    EXPECT_EQ(map.get(12345), (int *) 0);
    EXPECT_EQ(map.chunkCount(), 0);
}

TEST(KeelChunkMap, IndexSplitting)
{
    EXPECT_EQ(IntChunkMap::chunkIndex(0), 0);
    EXPECT_EQ(IntChunkMap::chunkIndex(15), 0);
    EXPECT_EQ(IntChunkMap::chunkIndex(16), 1);
    EXPECT_EQ(IntChunkMap::chunkOffset(17), 1);
    EXPECT_EQ(IntChunkMap::chunkOffset(31), 15);
}

TEST(KeelChunkMap, EnsureThenSet)
{
    IntChunkMap::ChunkPool pool;
    IntChunkMap map(&pool);

    int a = 1, b = 2;
    ASSERT_NE(map.ensureChunk(20), (IntChunkMap::Chunk *) 0);
    EXPECT_EQ(map.get(20), (int *) 0);

    EXPECT_EQ(map.set(20, &a), (int *) 0);
    EXPECT_EQ(map.get(20), &a);
    EXPECT_EQ(map.set(20, &b), &a);
    EXPECT_EQ(map.get(20), &b);

    // Neighbouring slots share the chunk and stay null.
    EXPECT_EQ(map.get(21), (int *) 0);
    EXPECT_EQ(map.chunkCount(), 1);

    map.take(20);
}

TEST(KeelChunkMap, EnsureIsIdempotent)
{
    IntChunkMap::ChunkPool pool;
    IntChunkMap map(&pool);

    IntChunkMap::Chunk *pChunk = map.ensureChunk(3);
    EXPECT_EQ(map.ensureChunk(7), pChunk);
    EXPECT_EQ(map.chunkCount(), 1);
    EXPECT_EQ(pool.live(), 1);
}

TEST(KeelChunkMap, EnsureFailsWhenPoolExhausted)
{
    IntChunkMap::ChunkPool pool(1);
    IntChunkMap map(&pool);

    EXPECT_NE(map.ensureChunk(0), (IntChunkMap::Chunk *) 0);
    EXPECT_EQ(map.ensureChunk(16), (IntChunkMap::Chunk *) 0);
    EXPECT_EQ(map.chunkCount(), 1);
}

TEST(KeelChunkMap, TakeFreesEmptyChunk)
{
    IntChunkMap::ChunkPool pool;
    IntChunkMap map(&pool);

    int a = 1, b = 2;
    map.ensureChunk(0);
    map.set(0, &a);
    map.set(1, &b);

    EXPECT_EQ(map.take(0), &a);
    EXPECT_EQ(map.chunkCount(), 1);
    EXPECT_EQ(map.take(1), &b);
    EXPECT_EQ(map.chunkCount(), 0);
    EXPECT_EQ(pool.live(), 0);

    EXPECT_EQ(map.take(1), (int *) 0);
}

TEST(KeelChunkMap, ClearReturnsChunks)
{
    IntChunkMap::ChunkPool pool;
    IntChunkMap map(&pool);

    map.ensureChunk(0);
    map.ensureChunk(100);
    map.ensureChunk(1000);
    EXPECT_EQ(pool.live(), 3);

    map.clear();
    EXPECT_EQ(map.chunkCount(), 0);
    EXPECT_EQ(pool.live(), 0);
}

TEST(KeelChunkMap, IterateChunks)
{
    IntChunkMap::ChunkPool pool;
    IntChunkMap map(&pool);

    int a = 1, b = 2;
    map.ensureChunk(5);
    map.set(5, &a);
    map.ensureChunk(40);
    map.set(40, &b);

    size_t chunks = 0;
    size_t firstSum = 0;
    for (IntChunkMap::Iterator it = map.begin(); it != map.end(); ++it)
    {
        ++chunks;
        firstSum += IntChunkMap::firstIndex(it);
    }

    EXPECT_EQ(chunks, 2);
    EXPECT_EQ(firstSum, 0 + 32);
}

TEST(KeelChunkMapDeathTest, SetWithoutChunk)
{
    IntChunkMap::ChunkPool pool;
    IntChunkMap map(&pool);

    int a = 1;
    EXPECT_DEATH(map.set(3, &a), "no chunk");
}
