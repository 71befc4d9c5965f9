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
 * @file generator.hpp
 * @brief Sharded, lock-free generator of version 4 and version 7 UUIDs.
 *
 * @details
 * This file declares the `Generator` class (the shard pool) and the
 * process-wide convenience functions `mintid::new_v4()`, `mintid::new_v7()` and
 * `mintid::new_v7_lazy()`.
 *
 * ## Ordering contract
 * Version 7 values produced by a serialized sequence of calls on the same shard
 * are non-decreasing in `(timestamp, counter)`. Shard selection is only a
 * locality hint (the CPU the caller currently runs on), so a thread may migrate
 * between shards and two threads may share one. No ordering is promised
 * across shards, nor for version 4 values.
 */

#pragma once

#include "mintid/core/uuid.hpp"
#include "mintid/gen/clock.hpp"
#include "mintid/gen/entropy.hpp"
#include "mintid/gen/shard.hpp"

#include <cstddef>
#include <memory>

namespace mintid::gen {

/**
 * @struct GeneratorConfig
 * @brief Construction-time tuning of the shard pool.
 */
struct GeneratorConfig {
    /// Requested shard count; rounded up to a power of two. `0` selects
    /// `std::thread::hardware_concurrency()`.
    size_t shard_count = 0;
};

/**
 * @class Generator
 * @brief Owns the shard array and runs the generation algorithms against it.
 *
 * @details
 * The shard array and its mask are fixed at construction and read-only
 * afterwards; only per-shard state mutates. Every member function may be
 * called concurrently from any number of threads.
 *
 * **Error model:** a failure of the entropy source is raised as
 * `mintid::EntropyError` from the call that needed the bytes. Counter
 * overflow and clock regressions are absorbed internally.
 */
class Generator {
  public:
    /**
     * @brief Builds a pool and pre-fills every shard buffer.
     *
     * @param source The true random source; shared with nothing else is fine.
     * @param clock Millisecond clock for version 7 timestamps.
     * @param config Pool sizing.
     * @throws EntropyError If the initial fill fails.
     */
    Generator(std::shared_ptr<EntropySource> source, std::shared_ptr<Clock> clock,
              GeneratorConfig config = GeneratorConfig());

    /// @brief A pool over the kernel CSPRNG and the system clock.
    explicit Generator(GeneratorConfig config = GeneratorConfig());

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    /**
     * @brief The process-wide pool, created on first use and never destroyed.
     */
    static Generator& instance();

    /// @brief A version 4 (random) UUID from the caller's shard.
    core::Uuid new_v4();

    /// @brief A version 7 UUID, monotonic per shard.
    core::Uuid new_v7();

    /**
     * @brief A version 7 UUID with a fully random tail.
     *
     * No counter is kept, so two values of the same millisecond are unordered.
     * Touches no shared clock state.
     */
    core::Uuid new_v7_lazy();

    /// @name Explicit shard variants; `shard` is reduced modulo `shard_count()`.
    /// @{
    core::Uuid new_v4_at(size_t shard);
    core::Uuid new_v7_at(size_t shard);
    core::Uuid new_v7_lazy_at(size_t shard);
    /// @}

    /**
     * @brief The shard the calling thread would use right now.
     *
     * Masks `sched_getcpu()`; falls back to a per-thread round-robin slot when
     * the CPU number is unavailable.
     */
    size_t select_shard() const;

    /// @brief Number of shards, always a power of two.
    size_t shard_count() const
    {
        return size_;
    }

    /// @brief Read-only view of a shard, for inspection.
    const EntropyShard& shard(size_t index) const
    {
        return shards_[index & mask_];
    }

  private:
    /**
     * @brief Claims the next `(timestamp, counter)` pair on `shard`.
     *
     * Optimistic retry loop over the shard's packed clock word:
     * - **advance**: the clock moved past `last_millis`; install `(now, seed)`
     * with a 12-bit random seed.
     * - **increment**: same millisecond or clock went backward; install
     * `(last_millis, counter + 1)`.
     * - **overflow-wait**: the counter is at 4095; yield, re-read the clock.
     */
    Stamp next_stamp(EntropyShard& shard);

    std::shared_ptr<EntropySource> source_;
    std::shared_ptr<Clock> clock_;
    size_t size_;
    size_t mask_;
    std::unique_ptr<EntropyShard[]> shards_;
};

} // namespace mintid::gen

namespace mintid {

/// @brief `Generator::instance().new_v4()`.
core::Uuid new_v4();

/// @brief `Generator::instance().new_v7()`.
core::Uuid new_v7();

/// @brief `Generator::instance().new_v7_lazy()`.
core::Uuid new_v7_lazy();

} // namespace mintid
