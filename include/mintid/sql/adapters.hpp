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
 * @file adapters.hpp
 * @brief Database driver bindings and the nullable `NullUuid` wrapper.
 *
 * @details
 * Drivers exchange column values as a `DbValue`: SQL `NULL`, text, a binary
 * blob, or an already-typed `Uuid`. `value()` produces what a driver should
 * bind for a parameter; `scan()` converts what a driver read back. Nullable
 * columns go through `NullUuid`, which also marshals to and from JSON.
 */

#pragma once

#include "mintid/core/uuid.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mintid::sql {

/**
 * @brief A column value as seen by a database driver.
 *
 * `std::monostate` stands for SQL `NULL`.
 */
using DbValue = std::variant<std::monostate, std::string, std::vector<uint8_t>, core::Uuid>;

/**
 * @brief The driver value bound for `u`: its canonical text form.
 */
DbValue value(const core::Uuid& u);

/**
 * @brief Converts a driver value into a UUID.
 *
 * **Conversion Rules:**
 * - `Uuid`: copied as-is.
 * - 16-byte blob: taken as the binary form.
 * - Any other blob: decoded as text.
 * - String: parsed as text.
 * - `NULL`: rejected.
 *
 * @throws FormatError For malformed text or blob content.
 * @throws ScanError For `NULL`.
 */
core::Uuid scan(const DbValue& src);

/**
 * @struct NullUuid
 * @brief A UUID that may be SQL `NULL` / JSON `null`.
 */
struct NullUuid {
    core::Uuid uuid;
    bool valid = false;

    /// @brief `NULL` when invalid, otherwise `sql::value(uuid)`.
    DbValue value() const;

    /**
     * @brief Reads a driver value; `NULL` yields `{nil, false}`.
     *
     * Any other value delegates to `sql::scan` and sets `valid` on success.
     */
    void scan(const DbValue& src);

    /// @brief `null`, or the canonical form as a JSON string.
    std::string to_json() const;

    /**
     * @brief Parses `null` or a JSON string holding any supported text form.
     *
     * A bare unquoted token is also accepted and handed to the text parser.
     * On success `valid` is true; on failure `valid` is false and the
     * error is rethrown.
     *
     * @throws FormatError For malformed UUID text.
     */
    void from_json(std::string_view json);

    friend bool operator==(const NullUuid& a, const NullUuid& b)
    {
        return a.valid == b.valid && (!a.valid || a.uuid == b.uuid);
    }
    friend bool operator!=(const NullUuid& a, const NullUuid& b)
    {
        return !(a == b);
    }
};

} // namespace mintid::sql
