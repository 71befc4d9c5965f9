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
 * @file codec.hpp
 * @brief Textual and binary encodings of the `Uuid` value type.
 *
 * @details
 * Supported text forms on input:
 *
 * | Length | Form                                              |
 * |--------|---------------------------------------------------|
 * | 36     | `6ba7b810-9dad-11d1-80b4-00c04fd430c8`            |
 * | 32     | `6ba7b8109dad11d180b400c04fd430c8`                |
 * | 38/34  | `{6ba7b810-9dad-11d1-80b4-00c04fd430c8}` / braced hex |
 * | 45/41  | `urn:uuid:6ba7b810-...` / URN with hex body       |
 *
 * Hex digits are accepted in either case. Output defaults to the lower-case
 * canonical form.
 */

#pragma once

#include "mintid/core/uuid.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace mintid::core {

/**
 * @enum Format
 * @brief Output layouts for `to_string`.
 */
enum class Format {
    Canonical,      ///< `xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx`, lower case.
    CanonicalUpper, ///< Canonical with `A-F` digits.
    Hex,            ///< 32 hex digits, no dashes.
    HexUpper,       ///< 32 upper-case hex digits.
    Braced,         ///< `{canonical}`.
    Urn             ///< `urn:uuid:canonical`.
};

/**
 * @brief Encodes a UUID as text.
 *
 * @param u The identifier to encode.
 * @param format The output layout (default: lower-case canonical).
 * @return std::string The encoded text.
 */
std::string to_string(const Uuid& u, Format format = Format::Canonical);

/**
 * @brief Parses any of the supported text forms.
 *
 * @param text The input text.
 * @return Uuid The decoded identifier.
 * @throws FormatError On a wrong length, bad brace/URN wrapping, a missing dash at
 * position 8, 13, 18 or 23 of the canonical body, or a non-hex digit.
 */
Uuid parse(std::string_view text);

/**
 * @brief Non-throwing `parse`: returns the nil UUID on malformed input.
 */
Uuid from_string_or_nil(std::string_view text) noexcept;

/**
 * @brief Decodes the 16-byte binary form.
 *
 * @throws LengthError When `length != 16`.
 */
Uuid from_bytes(const uint8_t* data, size_t length);

/// @overload
Uuid from_bytes(const std::vector<uint8_t>& data);

/// @brief Non-throwing `from_bytes`: returns the nil UUID on a length mismatch.
Uuid from_bytes_or_nil(const std::vector<uint8_t>& data) noexcept;

/**
 * @brief Returns a freshly allocated copy of the 16 raw bytes.
 *
 * Modifying the returned vector does not affect `u`.
 */
std::vector<uint8_t> to_bytes(const Uuid& u);

/// @brief Human-readable name of a variant family (`"RFC9562"`, `"NCS"`, ...).
const char* variant_name(Variant variant);

/// @brief Writes the lower-case canonical form.
std::ostream& operator<<(std::ostream& os, const Uuid& u);

} // namespace mintid::core
