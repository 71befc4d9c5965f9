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
 * @file generator.cpp
 * @brief Shard selection and the version 4 / version 7 generation algorithms.
 *
 * @details
 * Version 7 layout produced here:
 *
 * | Bits    | Field                               |
 * |---------|-------------------------------------|
 * | 0-47    | unix_ts_ms, big-endian              |
 * | 48-51   | version (0111)                      |
 * | 52-63   | 12-bit per-shard counter            |
 * | 64-65   | variant (10)                        |
 * | 66-127  | buffered randomness                 |
 */

#include "mintid/gen/generator.hpp"

#include "mintid/infra/logger.hpp"

#include <atomic>
#include <sched.h>
#include <string>
#include <thread>
#include <utility>

namespace mintid::gen {

namespace {

/// Smallest power of two greater than or equal to `n` (and at least 1).
size_t round_up_pow2(size_t n)
{
    size_t size = 1;
    while (size < n) {
        size <<= 1;
    }
    return size;
}

/// Stable per-thread slot handed out round-robin on first use.
size_t thread_slot()
{
    static std::atomic<size_t> next_slot{0};
    thread_local size_t slot = next_slot.fetch_add(1, std::memory_order_relaxed);
    return slot;
}

void write_timestamp(core::Uuid::Bytes& b, uint64_t millis)
{
    b[0] = static_cast<uint8_t>(millis >> 40);
    b[1] = static_cast<uint8_t>(millis >> 32);
    b[2] = static_cast<uint8_t>(millis >> 24);
    b[3] = static_cast<uint8_t>(millis >> 16);
    b[4] = static_cast<uint8_t>(millis >> 8);
    b[5] = static_cast<uint8_t>(millis);
}

} // namespace

Generator::Generator(std::shared_ptr<EntropySource> source, std::shared_ptr<Clock> clock,
                     GeneratorConfig config)
    : source_(std::move(source)), clock_(std::move(clock))
{
    size_t requested = config.shard_count;
    if (requested == 0) {
        requested = std::thread::hardware_concurrency();
    }
    size_ = round_up_pow2(requested);
    mask_ = size_ - 1;
    shards_ = std::make_unique<EntropyShard[]>(size_);

    for (size_t i = 0; i < size_; ++i) {
        shards_[i].refill(*source_);
    }

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Generator: " + std::to_string(size_) + " shards online (" +
                           std::to_string(size_ * sizeof(EntropyShard)) + " bytes).");
}

Generator::Generator(GeneratorConfig config)
    : Generator(std::make_shared<SystemEntropySource>(), std::make_shared<SystemClock>(), config)
{
}

Generator& Generator::instance()
{
    // Never destroyed: callers running during static destruction still see a live pool.
    static Generator* pool = new Generator();
    return *pool;
}

size_t Generator::select_shard() const
{
    int cpu = ::sched_getcpu();
    if (cpu >= 0) {
        return static_cast<size_t>(cpu) & mask_;
    }
    return thread_slot() & mask_;
}

core::Uuid Generator::new_v4()
{
    return new_v4_at(select_shard());
}

core::Uuid Generator::new_v7()
{
    return new_v7_at(select_shard());
}

core::Uuid Generator::new_v7_lazy()
{
    return new_v7_lazy_at(select_shard());
}

core::Uuid Generator::new_v4_at(size_t shard)
{
    core::Uuid u;
    shards_[shard & mask_].take_bytes(*source_, u.mutable_bytes().data(), 16);
    u.set_version(core::kVersionRandom);
    u.set_variant(core::Variant::RFC9562);
    return u;
}

Stamp Generator::next_stamp(EntropyShard& shard)
{
    uint64_t now = clock_->now_millis() & kMaxMillis;

    while (true) {
        const uint64_t word = shard.load_clock();
        const Stamp last = EntropyShard::unpack(word);

        if (now > last.millis) {
            // New millisecond: start the counter at a random point.
            uint8_t seed[2];
            shard.take_bytes(*source_, seed, sizeof(seed));
            uint32_t counter = ((static_cast<uint32_t>(seed[0]) << 8) | seed[1]) % kCounterModulus;
            if (shard.advance_clock(word, EntropyShard::pack(now, counter))) {
                return Stamp{now, counter};
            }
            continue;
        }

        // Same millisecond, or the clock moved backward: stay on last.millis.
        if (last.counter + 1 < kCounterModulus) {
            if (shard.advance_clock(word, word + 1)) {
                return Stamp{last.millis, last.counter + 1};
            }
            continue;
        }

        // Counter exhausted for this millisecond: wait for the clock to move.
        std::this_thread::yield();
        now = clock_->now_millis() & kMaxMillis;
    }
}

core::Uuid Generator::new_v7_at(size_t shard_index)
{
    EntropyShard& shard = shards_[shard_index & mask_];
    const Stamp stamp = next_stamp(shard);

    core::Uuid u;
    core::Uuid::Bytes& b = u.mutable_bytes();
    write_timestamp(b, stamp.millis);
    b[6] = static_cast<uint8_t>(stamp.counter >> 8);
    b[7] = static_cast<uint8_t>(stamp.counter);
    shard.take_bytes(*source_, b.data() + 8, 8);

    // Stamped last so the random tail never overwrites them.
    u.set_version(core::kVersionTimeOrdered);
    u.set_variant(core::Variant::RFC9562);
    return u;
}

core::Uuid Generator::new_v7_lazy_at(size_t shard_index)
{
    EntropyShard& shard = shards_[shard_index & mask_];
    const uint64_t now = clock_->now_millis() & kMaxMillis;

    core::Uuid u;
    core::Uuid::Bytes& b = u.mutable_bytes();
    write_timestamp(b, now);
    shard.take_bytes(*source_, b.data() + 6, 10);
    u.set_version(core::kVersionTimeOrdered);
    u.set_variant(core::Variant::RFC9562);
    return u;
}

} // namespace mintid::gen

namespace mintid {

core::Uuid new_v4()
{
    return gen::Generator::instance().new_v4();
}

core::Uuid new_v7()
{
    return gen::Generator::instance().new_v7();
}

core::Uuid new_v7_lazy()
{
    return gen::Generator::instance().new_v7_lazy();
}

} // namespace mintid
