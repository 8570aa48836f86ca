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

#include <benchmark/benchmark.h>

#include <memory/ChunkMap.h>

typedef ChunkMap<int64_t> ValueChunkMap;

static void fill(ValueChunkMap &map, size_t count, size_t stride, int64_t *pValue)
{
    for (size_t i = 0; i < count; ++i)
    {
        size_t index = i * stride;
        map.ensureChunk(index);
        map.set(index, pValue);
    }
}

static void BM_ChunkMapFillDense(benchmark::State &state)
{
    int64_t value = 1;
    size_t count = state.range(0);

    while (state.KeepRunning())
    {
        ValueChunkMap::ChunkPool pool;
        ValueChunkMap map(&pool);
        fill(map, count, 1, &value);
    }

    state.SetItemsProcessed(int64_t(state.iterations()) * int64_t(count));
}

static void BM_ChunkMapFillSparse(benchmark::State &state)
{
    int64_t value = 1;
    size_t count = state.range(0);

    while (state.KeepRunning())
    {
        ValueChunkMap::ChunkPool pool;
        ValueChunkMap map(&pool);
        fill(map, count, ValueChunkMap::slotsPerChunk, &value);
    }

    state.SetItemsProcessed(int64_t(state.iterations()) * int64_t(count));
}

static void BM_ChunkMapLookup(benchmark::State &state)
{
    int64_t value = 1;
    size_t count = state.range(0);

    ValueChunkMap::ChunkPool pool;
    ValueChunkMap map(&pool);
    fill(map, count, 3, &value);

    while (state.KeepRunning())
    {
        for (size_t i = 0; i < count * 3; ++i)
            benchmark::DoNotOptimize(map.get(i));
    }

    state.SetItemsProcessed(int64_t(state.iterations()) * int64_t(count) * 3);
}

BENCHMARK(BM_ChunkMapFillDense)->Range(8, 16384);
BENCHMARK(BM_ChunkMapFillSparse)->Range(8, 16384);
BENCHMARK(BM_ChunkMapLookup)->Range(8, 16384);
