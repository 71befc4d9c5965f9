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
 * @file shard.cpp
 * @brief Buffered randomness of `EntropyShard`.
 *
 * @details
 * The buffer and cursor are plain memory. Exclusive access is handed from one
 * caller to the next through `busy_`: acquire on `test_and_set`, release on
 * `clear`, so every byte written by a refill is visible to the next reader.
 */

#include "mintid/gen/shard.hpp"

#include "mintid/infra/logger.hpp"

#include <cstring>
#include <thread>

namespace mintid::gen {

/**
 * @class EntropyShard::BufferGuard
 * @brief RAII holder of the shard's buffer flag.
 *
 * Spins briefly, then yields the time slice, so a refill in progress on another
 * thread does not burn a full quantum.
 */
class EntropyShard::BufferGuard {
  public:
    explicit BufferGuard(std::atomic_flag& flag) : flag_(flag)
    {
        int spins = 0;
        while (flag_.test_and_set(std::memory_order_acquire)) {
            if (++spins > 64) {
                std::this_thread::yield();
            }
        }
    }

    ~BufferGuard()
    {
        flag_.clear(std::memory_order_release);
    }

    BufferGuard(const BufferGuard&) = delete;
    BufferGuard& operator=(const BufferGuard&) = delete;

  private:
    std::atomic_flag& flag_;
};

namespace {

/// Refill body shared by the public and guarded paths. Caller holds the flag.
void refill_locked(EntropySource& source, std::array<uint8_t, kEntropyBufferSize>& buffer,
                   size_t& cursor, std::atomic<uint64_t>& refills)
{
    // Exhaust first: if the source throws, no half-written byte is ever served.
    cursor = kEntropyBufferSize;
    source.fill(buffer.data(), buffer.size());
    cursor = 0;
    refills.fetch_add(1, std::memory_order_relaxed);
}

} // namespace

void EntropyShard::refill(EntropySource& source)
{
    BufferGuard guard(busy_);
    refill_locked(source, buffer_, cursor_, refills_);
}

void EntropyShard::take_bytes(EntropySource& source, uint8_t* out, size_t n)
{
    BufferGuard guard(busy_);

    if (cursor_ + n > kEntropyBufferSize) {
        infra::Logger::log(infra::LogLevel::TRACE, "Shard: entropy buffer exhausted, refilling.");
        refill_locked(source, buffer_, cursor_, refills_);
    }

    std::memcpy(out, buffer_.data() + cursor_, n);
    cursor_ += n;
}

size_t EntropyShard::cursor() const
{
    BufferGuard guard(busy_);
    return cursor_;
}

} // namespace mintid::gen
