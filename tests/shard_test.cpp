/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file shard_test.cpp
 * @brief Buffered randomness and layout of `EntropyShard`.
 *
 * @details
 * `PatternEntropySource` stamps every fill with a distinct pattern, so the
 * tests can tell exactly which fill and which buffer offset a byte came from.
 */

#include "fakes.hpp"
#include "framework.hpp"
#include "mintid/core/errors.hpp"
#include "mintid/gen/generator.hpp"
#include "mintid/gen/shard.hpp"

#include <cstdint>
#include <memory>
#include <vector>

using mintid::gen::EntropyShard;
using mintid::gen::kCacheLineSize;
using mintid::gen::kEntropyBufferSize;
using mintid::test::PatternEntropySource;

/**
 * @brief Each shard occupies whole cache lines, and neighbours never share one.
 */
void test_shard_layout_is_cache_aligned()
{
    ASSERT_EQ(alignof(EntropyShard), kCacheLineSize);
    ASSERT_EQ(sizeof(EntropyShard) % kCacheLineSize, static_cast<size_t>(0));

    mintid::gen::Generator gen(mintid::gen::GeneratorConfig{4});
    for (size_t i = 0; i + 1 < gen.shard_count(); ++i) {
        auto a = reinterpret_cast<uintptr_t>(&gen.shard(i));
        auto b = reinterpret_cast<uintptr_t>(&gen.shard(i + 1));
        ASSERT_EQ(a % kCacheLineSize, static_cast<uintptr_t>(0));
        ASSERT_TRUE(b - a >= kCacheLineSize);
    }
}

/**
 * @brief Consecutive takes walk the buffer in order with no overlap.
 */
void test_take_bytes_serves_sequential_bytes()
{
    PatternEntropySource source;
    EntropyShard shard;
    shard.refill(source);
    ASSERT_EQ(shard.cursor(), static_cast<size_t>(0));

    std::vector<uint8_t> served;
    for (int i = 0; i < 10; ++i) {
        uint8_t chunk[16];
        shard.take_bytes(source, chunk, sizeof(chunk));
        served.insert(served.end(), chunk, chunk + sizeof(chunk));
    }

    ASSERT_EQ(shard.cursor(), static_cast<size_t>(160));
    ASSERT_EQ(source.fills(), static_cast<uint64_t>(1));
    for (size_t i = 0; i < served.size(); ++i) {
        ASSERT_EQ(served[i], PatternEntropySource::expected(1, i));
    }
}

/**
 * @brief A request that would cross the end triggers a wholesale refill first.
 */
void test_take_bytes_refills_when_short()
{
    PatternEntropySource source;
    EntropyShard shard;
    shard.refill(source);

    std::vector<uint8_t> sink(kEntropyBufferSize - 4);
    shard.take_bytes(source, sink.data(), sink.size());
    ASSERT_EQ(shard.refill_count(), static_cast<uint64_t>(1));

    uint8_t tail[8];
    shard.take_bytes(source, tail, sizeof(tail));

    ASSERT_EQ(shard.refill_count(), static_cast<uint64_t>(2));
    ASSERT_EQ(shard.cursor(), static_cast<size_t>(8));
    for (size_t i = 0; i < sizeof(tail); ++i) {
        // Served from offset 0 of the second fill; the 4 leftover bytes are dropped.
        ASSERT_EQ(tail[i], PatternEntropySource::expected(2, i));
    }
}

/**
 * @brief A request that ends exactly at the boundary does not refill.
 */
void test_take_bytes_exact_fit_does_not_refill()
{
    PatternEntropySource source;
    EntropyShard shard;
    shard.refill(source);

    std::vector<uint8_t> sink(kEntropyBufferSize - 8);
    shard.take_bytes(source, sink.data(), sink.size());

    uint8_t last[8];
    shard.take_bytes(source, last, sizeof(last));
    ASSERT_EQ(shard.refill_count(), static_cast<uint64_t>(1));
    ASSERT_EQ(shard.cursor(), kEntropyBufferSize);
    ASSERT_EQ(last[7], PatternEntropySource::expected(1, kEntropyBufferSize - 1));
}

/**
 * @brief A failing source surfaces the error and never serves stale bytes.
 */
void test_refill_failure_leaves_buffer_exhausted()
{
    mintid::test::FailingEntropySource source(1);
    EntropyShard shard;
    shard.refill(source);

    std::vector<uint8_t> sink(kEntropyBufferSize);
    shard.take_bytes(source, sink.data(), sink.size());

    uint8_t one[1];
    ASSERT_THROWS(shard.take_bytes(source, one, 1), mintid::EntropyError);
    ASSERT_EQ(shard.cursor(), kEntropyBufferSize);

    // Still exhausted: the next call asks the source again instead of reusing bytes.
    ASSERT_THROWS(shard.take_bytes(source, one, 1), mintid::EntropyError);
    ASSERT_EQ(source.calls(), static_cast<uint64_t>(3));
}

void test_clock_word_packing()
{
    const uint64_t ms = 0x0123456789ABULL;
    uint64_t word = EntropyShard::pack(ms, 4095);
    auto stamp = EntropyShard::unpack(word);
    ASSERT_EQ(stamp.millis, ms);
    ASSERT_EQ(stamp.counter, static_cast<uint32_t>(4095));

    // Lexicographic (millis, counter) order equals integer order of the word.
    ASSERT_TRUE(EntropyShard::pack(ms, 4095) < EntropyShard::pack(ms + 1, 0));
    ASSERT_TRUE(EntropyShard::pack(ms, 7) + 1 == EntropyShard::pack(ms, 8));

    EntropyShard shard;
    ASSERT_EQ(shard.load_clock(), static_cast<uint64_t>(0));
    ASSERT_TRUE(shard.advance_clock(0, word));
    ASSERT_FALSE(shard.advance_clock(0, word + 1));
    ASSERT_EQ(shard.load_clock(), word);
}
