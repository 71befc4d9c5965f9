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
 * @file codec_test.cpp
 * @brief Encoding and parsing of the supported UUID text and binary forms.
 *
 * @details
 * The reference value throughout is the RFC 9562 DNS namespace identifier
 * `6ba7b810-9dad-11d1-80b4-00c04fd430c8`.
 */

#include "framework.hpp"
#include "mintid/core/codec.hpp"
#include "mintid/core/errors.hpp"
#include "mintid/gen/generator.hpp"

#include <string>
#include <vector>

using mintid::core::Format;
using mintid::core::Uuid;

namespace {

const Uuid kNamespaceDns(Uuid::Bytes{0x6B, 0xA7, 0xB8, 0x10, 0x9D, 0xAD, 0x11, 0xD1, 0x80, 0xB4,
                                     0x00, 0xC0, 0x4F, 0xD4, 0x30, 0xC8});

const std::string kCanonical = "6ba7b810-9dad-11d1-80b4-00c04fd430c8";

} // namespace

void test_encode_every_format()
{
    using mintid::core::to_string;
    ASSERT_EQ(to_string(kNamespaceDns), kCanonical);
    ASSERT_EQ(to_string(kNamespaceDns, Format::CanonicalUpper),
              std::string("6BA7B810-9DAD-11D1-80B4-00C04FD430C8"));
    ASSERT_EQ(to_string(kNamespaceDns, Format::Hex),
              std::string("6ba7b8109dad11d180b400c04fd430c8"));
    ASSERT_EQ(to_string(kNamespaceDns, Format::HexUpper),
              std::string("6BA7B8109DAD11D180B400C04FD430C8"));
    ASSERT_EQ(to_string(kNamespaceDns, Format::Braced), "{" + kCanonical + "}");
    ASSERT_EQ(to_string(kNamespaceDns, Format::Urn), "urn:uuid:" + kCanonical);
}

/**
 * @brief Dashed, braced, URN and undashed forms of one value decode identically.
 */
void test_parse_accepts_all_forms()
{
    const std::vector<std::string> forms = {
        kCanonical,                                   // 36
        "6ba7b8109dad11d180b400c04fd430c8",           // 32
        "{6ba7b8109dad11d180b400c04fd430c8}",         // 34
        "{" + kCanonical + "}",                       // 38
        "urn:uuid:6ba7b8109dad11d180b400c04fd430c8",  // 41
        "urn:uuid:" + kCanonical,                     // 45
        "6BA7B810-9DAD-11D1-80B4-00C04FD430C8",       // upper case
    };
    for (const std::string& text : forms) {
        ASSERT_EQ(mintid::core::parse(text), kNamespaceDns);
    }
}

/**
 * @brief Only lengths {32, 34, 36, 38, 41, 45} are candidates.
 */
void test_parse_rejects_unsupported_lengths()
{
    for (size_t len : {0, 1, 31, 33, 35, 37, 39, 40, 42, 44, 46, 64}) {
        std::string text(len, 'a');
        ASSERT_THROWS(mintid::core::parse(text), mintid::FormatError);
    }
}

/**
 * @brief A 36-character string missing any one of its dashes is rejected.
 */
void test_parse_rejects_missing_dash()
{
    for (size_t pos : {8, 13, 18, 23}) {
        std::string text = kCanonical;
        text[pos] = '0';
        ASSERT_THROWS(mintid::core::parse(text), mintid::FormatError);
    }

    std::string braced = "{" + kCanonical + "}";
    braced[1 + 13] = 'f';
    ASSERT_THROWS(mintid::core::parse(braced), mintid::FormatError);
}

void test_parse_rejects_bad_wrapping()
{
    ASSERT_THROWS(mintid::core::parse("(" + kCanonical + "}"), mintid::FormatError);
    ASSERT_THROWS(mintid::core::parse("{" + kCanonical + ")"), mintid::FormatError);
    ASSERT_THROWS(mintid::core::parse("urn:uid::" + kCanonical), mintid::FormatError);
    ASSERT_THROWS(mintid::core::parse("URN:UUID:" + kCanonical), mintid::FormatError);
}

void test_parse_rejects_invalid_hex()
{
    std::string text = kCanonical;
    text[0] = 'g';
    ASSERT_THROWS(mintid::core::parse(text), mintid::FormatError);

    std::string hex = "6ba7b8109dad11d180b400c04fd430cz";
    ASSERT_THROWS(mintid::core::parse(hex), mintid::FormatError);

    // A dash inside the 32-digit form is not a hex digit.
    std::string dashed32 = "6ba7b810-dad11d180b400c04fd430c8";
    ASSERT_THROWS(mintid::core::parse(dashed32), mintid::FormatError);

    try {
        mintid::core::parse(text);
        ASSERT_TRUE(false);
    } catch (const mintid::FormatError& e) {
        ASSERT_EQ(e.input(), text);
    }
}

/**
 * @brief Generated identifiers survive every text form and the binary form.
 */
void test_generated_values_round_trip()
{
    const Format formats[] = {Format::Canonical, Format::CanonicalUpper, Format::Hex,
                              Format::HexUpper,  Format::Braced,         Format::Urn};

    for (int i = 0; i < 64; ++i) {
        Uuid u = (i % 2 == 0) ? mintid::new_v4() : mintid::new_v7();
        for (Format f : formats) {
            ASSERT_EQ(mintid::core::parse(mintid::core::to_string(u, f)), u);
        }
        ASSERT_EQ(mintid::core::from_bytes(mintid::core::to_bytes(u)), u);
    }
}

void test_binary_length_is_enforced()
{
    ASSERT_THROWS(mintid::core::from_bytes(std::vector<uint8_t>(15, 0)), mintid::LengthError);
    ASSERT_THROWS(mintid::core::from_bytes(std::vector<uint8_t>(17, 0)), mintid::LengthError);

    try {
        mintid::core::from_bytes(std::vector<uint8_t>(3, 0));
        ASSERT_TRUE(false);
    } catch (const mintid::LengthError& e) {
        ASSERT_EQ(e.length(), static_cast<size_t>(3));
    }

    // to_bytes hands out a copy.
    std::vector<uint8_t> copy = mintid::core::to_bytes(kNamespaceDns);
    copy[0] = 0;
    ASSERT_EQ(static_cast<int>(kNamespaceDns[0]), 0x6B);
}

void test_or_nil_helpers()
{
    ASSERT_EQ(mintid::core::from_string_or_nil(kCanonical), kNamespaceDns);
    ASSERT_TRUE(mintid::core::from_string_or_nil("not-a-uuid").is_nil());
    ASSERT_TRUE(mintid::core::from_bytes_or_nil(std::vector<uint8_t>(4, 1)).is_nil());
    ASSERT_EQ(mintid::core::from_bytes_or_nil(mintid::core::to_bytes(kNamespaceDns)),
              kNamespaceDns);
}
