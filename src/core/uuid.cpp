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
 * @file uuid.cpp
 * @brief Bit-level accessors of the `Uuid` value type.
 */

#include "mintid/core/uuid.hpp"

namespace mintid::core {

/**
 * @brief Classifies byte 8 using the RFC 9562 Table 1 thresholds.
 *
 * | Top bits | Variant   |
 * |----------|-----------|
 * | `0`      | NCS       |
 * | `10`     | RFC 9562  |
 * | `110`    | Microsoft |
 * | `111`    | Future    |
 */
Variant Uuid::variant() const
{
    const uint8_t b = bytes_[8];
    if ((b >> 7) == 0x00) {
        return Variant::NCS;
    }
    if ((b >> 6) == 0x02) {
        return Variant::RFC9562;
    }
    if ((b >> 5) == 0x06) {
        return Variant::Microsoft;
    }
    return Variant::Future;
}

void Uuid::set_variant(Variant variant)
{
    uint8_t& b = bytes_[8];
    switch (variant) {
    case Variant::NCS:
        b = static_cast<uint8_t>(b & 0x7F);
        break;
    case Variant::RFC9562:
        b = static_cast<uint8_t>((b & 0x3F) | 0x80);
        break;
    case Variant::Microsoft:
        b = static_cast<uint8_t>((b & 0x1F) | 0xC0);
        break;
    case Variant::Future:
        b = static_cast<uint8_t>((b & 0x1F) | 0xE0);
        break;
    }
}

bool Uuid::is_nil() const
{
    for (uint8_t b : bytes_) {
        if (b != 0) {
            return false;
        }
    }
    return true;
}

int Uuid::compare(const Uuid& other) const
{
    // The first differing byte from index 0 decides the order.
    for (size_t i = 0; i < bytes_.size(); ++i) {
        if (bytes_[i] != other.bytes_[i]) {
            return bytes_[i] < other.bytes_[i] ? -1 : 1;
        }
    }
    return 0;
}

uint64_t Uuid::unix_millis() const
{
    uint64_t ms = 0;
    for (size_t i = 0; i < 6; ++i) {
        ms = (ms << 8) | bytes_[i];
    }
    return ms;
}

std::chrono::system_clock::time_point Uuid::time() const
{
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(unix_millis())));
}

} // namespace mintid::core
