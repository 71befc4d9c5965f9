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
 * @file uuid.hpp
 * @brief The fixed-width 128-bit identifier value type (RFC 9562).
 *
 * @details
 * This header declares `Uuid`, the 16-byte value produced by the generators and
 * consumed by the codec and driver adapters. It carries no behavior beyond byte
 * inspection: version and variant are read and stamped by bit position, and
 * ordering is the unsigned big-endian 128-bit order of the raw bytes.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace mintid::core {

/**
 * @enum Variant
 * @brief Layout families selected by the top bits of byte 8.
 */
enum class Variant : uint8_t {
    NCS,       ///< `0xxxxxxx` Reserved, NCS backward compatibility.
    RFC9562,   ///< `10xxxxxx` The layout specified by RFC 9562.
    Microsoft, ///< `110xxxxx` Reserved, Microsoft Corporation backward compatibility.
    Future     ///< `111xxxxx` Reserved for future definition.
};

/// @brief Version numbers produced by this library.
constexpr uint8_t kVersionRandom = 4;
constexpr uint8_t kVersionTimeOrdered = 7;

/**
 * @class Uuid
 * @brief An immutable-by-convention 16-byte identifier.
 *
 * @details
 * Byte layout follows RFC 9562 network order. The version occupies the high
 * nibble of byte 6; the variant occupies the top one to three bits of byte 8.
 * Every accessor is a pure bit read, so a value that was never produced by a
 * generator (for example `01 02 .. 10`) simply reports whatever its bits say.
 */
class Uuid {
  public:
    /// @brief Raw storage type, index 0 is the most significant byte.
    using Bytes = std::array<uint8_t, 16>;

    /// @brief Constructs the nil UUID (all 128 bits zero).
    constexpr Uuid() : bytes_{} {}

    /// @brief Constructs a UUID from its 16 raw bytes.
    constexpr explicit Uuid(const Bytes& bytes) : bytes_(bytes) {}

    /// @brief The nil UUID, all bits cleared.
    static constexpr Uuid nil()
    {
        return Uuid();
    }

    /// @brief The max UUID, all bits set.
    static constexpr Uuid max()
    {
        return Uuid(Bytes{0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
                          0xFF, 0xFF, 0xFF, 0xFF});
    }

    /**
     * @brief Returns the algorithm version stored in the high nibble of byte 6.
     *
     * @return uint8_t A value in `[0, 15]`.
     */
    uint8_t version() const
    {
        return static_cast<uint8_t>(bytes_[6] >> 4);
    }

    /**
     * @brief Classifies the layout variant from the top bits of byte 8.
     */
    Variant variant() const;

    /**
     * @brief Overwrites the version nibble, preserving the low nibble of byte 6.
     *
     * @param version The version number; only the low four bits are used.
     */
    void set_version(uint8_t version)
    {
        bytes_[6] = static_cast<uint8_t>((bytes_[6] & 0x0F) | ((version & 0x0F) << 4));
    }

    /**
     * @brief Stamps the variant bits into byte 8.
     *
     * NCS rewrites one bit, RFC 9562 two bits, Microsoft and Future three bits.
     * The remaining low bits of byte 8 are preserved.
     */
    void set_variant(Variant variant);

    /// @brief True when every byte is zero.
    bool is_nil() const;

    /**
     * @brief Three-way comparison as unsigned big-endian 128-bit integers.
     *
     * @return int `-1`, `0` or `1`.
     */
    int compare(const Uuid& other) const;

    /**
     * @brief The 48-bit Unix millisecond timestamp held in bytes 0-5.
     *
     * Only meaningful for version 7 values.
     */
    uint64_t unix_millis() const;

    /// @brief `unix_millis()` as a system clock time point.
    std::chrono::system_clock::time_point time() const;

    /// @brief Read-only view of the raw bytes.
    const Bytes& bytes() const
    {
        return bytes_;
    }

    /// @brief Mutable view of the raw bytes, used by generators and decoders.
    Bytes& mutable_bytes()
    {
        return bytes_;
    }

    uint8_t operator[](size_t index) const
    {
        return bytes_[index];
    }

    friend bool operator==(const Uuid& a, const Uuid& b)
    {
        return a.bytes_ == b.bytes_;
    }
    friend bool operator!=(const Uuid& a, const Uuid& b)
    {
        return !(a == b);
    }
    friend bool operator<(const Uuid& a, const Uuid& b)
    {
        return a.compare(b) < 0;
    }
    friend bool operator<=(const Uuid& a, const Uuid& b)
    {
        return a.compare(b) <= 0;
    }
    friend bool operator>(const Uuid& a, const Uuid& b)
    {
        return a.compare(b) > 0;
    }
    friend bool operator>=(const Uuid& a, const Uuid& b)
    {
        return a.compare(b) >= 0;
    }

  private:
    Bytes bytes_;
};

} // namespace mintid::core

namespace std {

/// @brief Hash support so identifiers can key unordered containers.
template <> struct hash<mintid::core::Uuid> {
    size_t operator()(const mintid::core::Uuid& u) const noexcept
    {
        // FNV-1a over the 16 bytes.
        uint64_t h = 1469598103934665603ULL;
        for (uint8_t b : u.bytes()) {
            h ^= b;
            h *= 1099511628211ULL;
        }
        return static_cast<size_t>(h);
    }
};

} // namespace std
