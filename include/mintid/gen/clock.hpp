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
 * @file clock.hpp
 * @brief Millisecond wall clock used to stamp version 7 identifiers.
 */

#pragma once

#include <cstdint>

namespace mintid::gen {

/**
 * @class Clock
 * @brief Abstract Unix millisecond time source.
 *
 * Implementations must be safe to call from any thread. The value may move
 * backward (NTP step); the generator tolerates that.
 */
class Clock {
  public:
    virtual ~Clock() = default;

    /// @brief Milliseconds since 1970-01-01T00:00:00Z.
    virtual uint64_t now_millis() = 0;
};

/**
 * @class SystemClock
 * @brief `std::chrono::system_clock` truncated to milliseconds.
 */
class SystemClock : public Clock {
  public:
    uint64_t now_millis() override;
};

} // namespace mintid::gen
