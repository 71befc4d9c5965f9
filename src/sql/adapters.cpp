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
 * @file adapters.cpp
 * @brief Driver value conversion and JSON marshaling of `NullUuid`.
 *
 * @details
 * JSON is produced and consumed through cJSON so that escaping and whitespace
 * follow the same rules as every other JSON document handled by the host
 * application.
 */

#include "mintid/sql/adapters.hpp"

#include "mintid/core/codec.hpp"
#include "mintid/core/errors.hpp"

#include <cJSON.h>
#include <cstdlib>

namespace mintid::sql {

namespace {

/**
 * @class ScopedJson
 * @brief RAII owner of a cJSON tree.
 */
class ScopedJson {
  public:
    explicit ScopedJson(cJSON* node) : node_(node) {}

    ScopedJson(const ScopedJson&) = delete;
    ScopedJson& operator=(const ScopedJson&) = delete;

    ~ScopedJson()
    {
        if (node_) {
            cJSON_Delete(node_);
        }
    }

    cJSON* get() const
    {
        return node_;
    }

  private:
    cJSON* node_;
};

/// Serialises `node` without whitespace and releases the cJSON buffer.
std::string print_compact(const cJSON* node)
{
    char* raw = cJSON_PrintUnformatted(node);
    if (!raw) {
        throw UuidError("uuid: JSON serialisation failed");
    }
    std::string out(raw);
    cJSON_free(raw);
    return out;
}

} // namespace

DbValue value(const core::Uuid& u)
{
    return DbValue(core::to_string(u));
}

core::Uuid scan(const DbValue& src)
{
    if (const auto* u = std::get_if<core::Uuid>(&src)) {
        return *u;
    }
    if (const auto* blob = std::get_if<std::vector<uint8_t>>(&src)) {
        if (blob->size() == 16) {
            return core::from_bytes(*blob);
        }
        return core::parse(
            std::string_view(reinterpret_cast<const char*>(blob->data()), blob->size()));
    }
    if (const auto* text = std::get_if<std::string>(&src)) {
        return core::parse(*text);
    }
    throw ScanError("uuid: cannot convert NULL to UUID");
}

DbValue NullUuid::value() const
{
    if (!valid) {
        return DbValue();
    }
    return sql::value(uuid);
}

void NullUuid::scan(const DbValue& src)
{
    if (std::holds_alternative<std::monostate>(src)) {
        uuid = core::Uuid::nil();
        valid = false;
        return;
    }
    uuid = sql::scan(src);
    valid = true;
}

std::string NullUuid::to_json() const
{
    ScopedJson node(valid ? cJSON_CreateString(core::to_string(uuid).c_str()) : cJSON_CreateNull());
    if (!node.get()) {
        throw UuidError("uuid: JSON allocation failed");
    }
    return print_compact(node.get());
}

/**
 * @brief Decodes a JSON scalar into the wrapper.
 *
 * Processing Pipeline:
 * 1. **Parse**: cJSON parses the document. Unparseable input (such as a bare
 * hex token) falls through to the text parser unchanged.
 * 2. **Null**: `null` resets the wrapper to `{nil, false}`.
 * 3. **String**: the string payload is handed to `core::parse`.
 */
void NullUuid::from_json(std::string_view json)
{
    std::string doc(json);
    ScopedJson root(cJSON_Parse(doc.c_str()));

    std::string text = doc;
    if (root.get()) {
        if (cJSON_IsNull(root.get())) {
            uuid = core::Uuid::nil();
            valid = false;
            return;
        }
        if (cJSON_IsString(root.get()) && root.get()->valuestring) {
            text = root.get()->valuestring;
        }
    }

    try {
        uuid = core::parse(text);
        valid = true;
    } catch (const FormatError&) {
        valid = false;
        throw;
    }
}

} // namespace mintid::sql
