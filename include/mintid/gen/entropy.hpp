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
 * @file entropy.hpp
 * @brief Sources of cryptographically strong random bytes.
 *
 * @details
 * The generator never calls the operating system per identifier; it pulls whole
 * buffers through this interface. Tests substitute deterministic or failing
 * sources by implementing `EntropySource`.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace mintid::gen {

/**
 * @class EntropySource
 * @brief Abstract provider of random bytes.
 */
class EntropySource {
  public:
    virtual ~EntropySource() = default;

    /**
     * @brief Fills `out[0, length)` completely with random bytes.
     *
     * @throws EntropyError If the source cannot supply the full amount. The
     * contents of `out` are unspecified in that case and must not be used.
     */
    virtual void fill(uint8_t* out, size_t length) = 0;
};

/**
 * @class SystemEntropySource
 * @brief Reads from the kernel CSPRNG through `getrandom(2)`.
 *
 * Short reads and `EINTR` are retried; any other error is raised as
 * `EntropyError` carrying `errno`.
 */
class SystemEntropySource : public EntropySource {
  public:
    void fill(uint8_t* out, size_t length) override;
};

} // namespace mintid::gen
