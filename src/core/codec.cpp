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
 * @file codec.cpp
 * @brief Table-driven hex encoding and validating parser for `Uuid` text.
 *
 * @details
 * Both directions walk the same offset table: the position of the first hex
 * digit of every byte inside the 36-character canonical layout. The 32-digit
 * form is simply `2 * index`.
 */

#include "mintid/core/codec.hpp"

#include "mintid/core/errors.hpp"

#include <cstring>

namespace mintid::core {

namespace {

/// Offset of each byte's first hex digit inside the canonical layout.
constexpr size_t kCanonicalOffsets[16] = {0, 2, 4, 6, 9, 11, 14, 16, 19, 21, 24, 26, 28, 30, 32, 34};

constexpr char kLowerDigits[] = "0123456789abcdef";
constexpr char kUpperDigits[] = "0123456789ABCDEF";

constexpr std::string_view kUrnPrefix = "urn:uuid:";

/// Returns the nibble value of a hex digit, or 0xFF when `c` is not one.
uint8_t from_hex_char(char c)
{
    if (c >= '0' && c <= '9') {
        return static_cast<uint8_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f') {
        return static_cast<uint8_t>(c - 'a' + 10);
    }
    if (c >= 'A' && c <= 'F') {
        return static_cast<uint8_t>(c - 'A' + 10);
    }
    return 0xFF;
}

void encode_canonical(char* dst, const Uuid& u, const char* digits)
{
    dst[8] = '-';
    dst[13] = '-';
    dst[18] = '-';
    dst[23] = '-';
    for (size_t i = 0; i < 16; ++i) {
        dst[kCanonicalOffsets[i]] = digits[u[i] >> 4];
        dst[kCanonicalOffsets[i] + 1] = digits[u[i] & 0x0F];
    }
}

void encode_hex(char* dst, const Uuid& u, const char* digits)
{
    for (size_t i = 0; i < 16; ++i) {
        dst[2 * i] = digits[u[i] >> 4];
        dst[2 * i + 1] = digits[u[i] & 0x0F];
    }
}

/// Decodes one byte from two hex digits, throwing on an invalid digit.
uint8_t decode_pair(std::string_view body, size_t pos, std::string_view original)
{
    uint8_t hi = from_hex_char(body[pos]);
    uint8_t lo = from_hex_char(body[pos + 1]);
    if ((hi | lo) == 0xFF) {
        throw FormatError("uuid: invalid hex digit in string \"" + std::string(original) + "\"",
                          std::string(original));
    }
    return static_cast<uint8_t>((hi << 4) | lo);
}

} // namespace

std::string to_string(const Uuid& u, Format format)
{
    switch (format) {
    case Format::CanonicalUpper: {
        std::string out(36, '\0');
        encode_canonical(&out[0], u, kUpperDigits);
        return out;
    }
    case Format::Hex: {
        std::string out(32, '\0');
        encode_hex(&out[0], u, kLowerDigits);
        return out;
    }
    case Format::HexUpper: {
        std::string out(32, '\0');
        encode_hex(&out[0], u, kUpperDigits);
        return out;
    }
    case Format::Braced: {
        std::string out(38, '\0');
        out[0] = '{';
        encode_canonical(&out[1], u, kLowerDigits);
        out[37] = '}';
        return out;
    }
    case Format::Urn: {
        std::string out(kUrnPrefix.size() + 36, '\0');
        std::memcpy(&out[0], kUrnPrefix.data(), kUrnPrefix.size());
        encode_canonical(&out[kUrnPrefix.size()], u, kLowerDigits);
        return out;
    }
    case Format::Canonical:
        break;
    }

    std::string out(36, '\0');
    encode_canonical(&out[0], u, kLowerDigits);
    return out;
}

/**
 * @brief Validates the wrapping of `text`, then decodes the inner body.
 *
 * Processing Pipeline:
 * 1. **Length dispatch**: 32/36 are bare bodies, 34/38 must be braced and
 * 41/45 must carry the `urn:uuid:` prefix. Any other length is rejected.
 * 2. **Dash check**: a 36-character body must have dashes at 8, 13, 18 and 23.
 * 3. **Hex decode**: every digit pair is decoded, any invalid digit rejects.
 */
Uuid parse(std::string_view text)
{
    std::string_view body = text;

    switch (text.size()) {
    case 32:
    case 36:
        break;
    case 34:
    case 38:
        if (text.front() != '{' || text.back() != '}') {
            throw FormatError("uuid: incorrect UUID format in string \"" + std::string(text) + "\"",
                              std::string(text));
        }
        body = text.substr(1, text.size() - 2);
        break;
    case 41:
    case 45:
        if (text.substr(0, kUrnPrefix.size()) != kUrnPrefix) {
            throw FormatError("uuid: incorrect UUID format in string \"" + std::string(text) + "\"",
                              std::string(text));
        }
        body = text.substr(kUrnPrefix.size());
        break;
    default:
        throw FormatError("uuid: incorrect UUID length " + std::to_string(text.size()) +
                              " in string \"" + std::string(text) + "\"",
                          std::string(text));
    }

    Uuid u;
    Uuid::Bytes& out = u.mutable_bytes();

    if (body.size() == 36) {
        if (body[8] != '-' || body[13] != '-' || body[18] != '-' || body[23] != '-') {
            throw FormatError("uuid: incorrect UUID format in string \"" + std::string(text) + "\"",
                              std::string(text));
        }
        for (size_t i = 0; i < 16; ++i) {
            out[i] = decode_pair(body, kCanonicalOffsets[i], text);
        }
        return u;
    }

    for (size_t i = 0; i < 16; ++i) {
        out[i] = decode_pair(body, 2 * i, text);
    }
    return u;
}

Uuid from_string_or_nil(std::string_view text) noexcept
{
    try {
        return parse(text);
    } catch (const FormatError&) {
        return Uuid::nil();
    }
}

Uuid from_bytes(const uint8_t* data, size_t length)
{
    if (length != 16) {
        throw LengthError("uuid: UUID must be exactly 16 bytes long, got " +
                              std::to_string(length) + " bytes",
                          length);
    }
    Uuid u;
    std::memcpy(u.mutable_bytes().data(), data, 16);
    return u;
}

Uuid from_bytes(const std::vector<uint8_t>& data)
{
    return from_bytes(data.data(), data.size());
}

Uuid from_bytes_or_nil(const std::vector<uint8_t>& data) noexcept
{
    if (data.size() != 16) {
        return Uuid::nil();
    }
    return from_bytes(data.data(), data.size());
}

std::vector<uint8_t> to_bytes(const Uuid& u)
{
    return std::vector<uint8_t>(u.bytes().begin(), u.bytes().end());
}

const char* variant_name(Variant variant)
{
    switch (variant) {
    case Variant::NCS:
        return "NCS";
    case Variant::RFC9562:
        return "RFC9562";
    case Variant::Microsoft:
        return "Microsoft";
    case Variant::Future:
        return "Future";
    }
    return "Future";
}

std::ostream& operator<<(std::ostream& os, const Uuid& u)
{
    return os << to_string(u);
}

} // namespace mintid::core
