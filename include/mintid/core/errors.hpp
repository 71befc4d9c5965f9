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
 * @file errors.hpp
 * @brief Exception hierarchy reported by the mintid library.
 *
 * @details
 * Every failure surfaced to callers derives from `UuidError`, itself a
 * `std::runtime_error`, so executables can catch `std::exception` at their
 * boundary and log it. Counter overflow and clock regressions inside the
 * generator are not failures and never appear here.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace mintid {

/**
 * @class UuidError
 * @brief Root of all library errors.
 */
class UuidError : public std::runtime_error {
  public:
    explicit UuidError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class EntropyError
 * @brief The operating system could not supply random bytes.
 *
 * Fatal to the generating call. The generator has no fallback source.
 */
class EntropyError : public UuidError {
  public:
    EntropyError(const std::string& message, int error_code)
        : UuidError(message), error_code_(error_code)
    {
    }

    /// @brief The `errno` reported by the source, or 0 when not applicable.
    int error_code() const
    {
        return error_code_;
    }

  private:
    int error_code_;
};

/**
 * @class FormatError
 * @brief Malformed textual input (length, wrapping, dash placement or hex digit).
 */
class FormatError : public UuidError {
  public:
    FormatError(const std::string& message, std::string input)
        : UuidError(message), input_(std::move(input))
    {
    }

    /// @brief The rejected input, kept for diagnostics.
    const std::string& input() const
    {
        return input_;
    }

  private:
    std::string input_;
};

/**
 * @class LengthError
 * @brief Binary input that is not exactly 16 bytes long.
 */
class LengthError : public FormatError {
  public:
    LengthError(const std::string& message, size_t length)
        : FormatError(message, std::string()), length_(length)
    {
    }

    size_t length() const
    {
        return length_;
    }

  private:
    size_t length_;
};

/**
 * @class ScanError
 * @brief A driver value whose type cannot be converted into a UUID.
 */
class ScanError : public UuidError {
  public:
    explicit ScanError(const std::string& message) : UuidError(message) {}
};

} // namespace mintid
