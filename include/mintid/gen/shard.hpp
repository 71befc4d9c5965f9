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
 * @file shard.hpp
 * @brief One cache-line isolated partition of generator state.
 *
 * @details
 * An `EntropyShard` bundles the two pieces of mutable state the generator needs
 * per partition:
 * - a 1 KiB block of kernel randomness plus a read cursor, so the system call
 * cost is paid once per 1024 bytes instead of once per identifier;
 * - the version 7 monotonicity state `(last_millis, counter)`, packed into a
 * single 64-bit atomic word so that both halves move together under one
 * compare-and-swap.
 *
 * Shards are aligned to the cache line, and the hot atomic word starts a line
 * of its own, so writers on neighbouring shards never invalidate each other.
 */

#pragma once

#include "mintid/gen/entropy.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>

namespace mintid::gen {

/// @brief Destructive interference size assumed for padding.
constexpr size_t kCacheLineSize = 64;

/// @brief Capacity of each shard's randomness buffer.
constexpr size_t kEntropyBufferSize = 1024;

/// @brief Width of the per-millisecond version 7 counter.
constexpr unsigned kCounterBits = 12;
constexpr uint32_t kCounterModulus = 1u << kCounterBits;

/// @brief Largest timestamp representable in the 48-bit field.
constexpr uint64_t kMaxMillis = (uint64_t{1} << 48) - 1;

/**
 * @struct Stamp
 * @brief The `(timestamp, counter)` pair a version 7 value is built from.
 */
struct Stamp {
    uint64_t millis;
    uint32_t counter;
};

/**
 * @class EntropyShard
 * @brief Buffered randomness and monotonic clock state for one partition.
 *
 * @details
 * **Ownership:** shards are owned by a `Generator` and never handed out for
 * mutation. Concurrent callers that land on the same shard are arbitrated by
 * atomics only: the clock word by compare-and-swap, the buffer by a
 * spin-then-yield flag held for the duration of a copy (or a refill).
 */
class alignas(kCacheLineSize) EntropyShard {
  public:
    EntropyShard() = default;

    EntropyShard(const EntropyShard&) = delete;
    EntropyShard& operator=(const EntropyShard&) = delete;

    /**
     * @brief Re-randomises the entire buffer and rewinds the cursor.
     *
     * @throws EntropyError When the source fails; the buffer is left exhausted.
     */
    void refill(EntropySource& source);

    /**
     * @brief Copies `n` never-served bytes into `out`.
     *
     * If fewer than `n` bytes remain before the end of the buffer, the whole
     * buffer is refilled from `source` first (no sliding append).
     *
     * @param source The true random source used on exhaustion.
     * @param out Destination, at least `n` bytes.
     * @param n Number of bytes, at most `kEntropyBufferSize`.
     * @throws EntropyError Propagated from the refill; nothing is copied.
     */
    void take_bytes(EntropySource& source, uint8_t* out, size_t n);

    /// @brief Offset of the next unused buffer byte.
    size_t cursor() const;

    /// @brief Number of refills performed so far, including the initial fill.
    uint64_t refill_count() const
    {
        return refills_.load(std::memory_order_relaxed);
    }

    // ------------------------------------------------------------------------
    // Version 7 clock state
    // ------------------------------------------------------------------------

    /// @brief Packs a stamp into the atomic word layout `millis << 12 | counter`.
    static constexpr uint64_t pack(uint64_t millis, uint32_t counter)
    {
        return (millis << kCounterBits) | (counter & (kCounterModulus - 1));
    }

    static constexpr Stamp unpack(uint64_t word)
    {
        return Stamp{word >> kCounterBits, static_cast<uint32_t>(word & (kCounterModulus - 1))};
    }

    uint64_t load_clock() const
    {
        return clock_.load(std::memory_order_acquire);
    }

    /**
     * @brief Installs `desired` only if the word still equals `expected`.
     *
     * @return true If this caller won the update.
     */
    bool advance_clock(uint64_t expected, uint64_t desired)
    {
        return clock_.compare_exchange_strong(expected, desired, std::memory_order_acq_rel,
                                              std::memory_order_acquire);
    }

  private:
    class BufferGuard;

    /// @brief Packed `(last_millis, counter)`, alone on its cache line.
    alignas(kCacheLineSize) std::atomic<uint64_t> clock_{0};

    alignas(kCacheLineSize) mutable std::atomic_flag busy_ = ATOMIC_FLAG_INIT;
    size_t cursor_ = kEntropyBufferSize;
    std::atomic<uint64_t> refills_{0};
    std::array<uint8_t, kEntropyBufferSize> buffer_{};
};

static_assert(sizeof(EntropyShard) % kCacheLineSize == 0,
              "EntropyShard must occupy whole cache lines");

} // namespace mintid::gen
