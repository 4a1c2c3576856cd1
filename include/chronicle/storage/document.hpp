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
 * @file document.hpp
 * @brief RAII ownership of cJSON trees exchanged with the document store.
 *
 * @details
 * Every document that crosses a public API boundary (query results, reconstructed
 * revisions, delta entries) is returned as a `Document`. The wrapper owns exactly one
 * `cJSON*` root and releases it with `cJSON_Delete` when it goes out of scope, so callers
 * never pair allocations with frees by hand.
 */

#pragma once

#include <cJSON.h>
#include <cstdint>
#include <optional>
#include <string>

namespace chronicle::storage {

/**
 * @class Document
 * @brief Owning handle to a cJSON value with value semantics.
 *
 * Copying performs a deep duplicate; moving transfers ownership and leaves the source
 * empty. An empty `Document` holds `nullptr` and converts to `false`.
 */
class Document {
  public:
    /// @brief Creates an empty handle.
    Document() = default;

    /// @brief Takes ownership of `raw` (which may be `nullptr`).
    explicit Document(cJSON* raw) : ptr_(raw) {}

    Document(const Document& other);
    Document(Document&& other) noexcept : ptr_(other.release()) {}
    Document& operator=(const Document& other);
    Document& operator=(Document&& other) noexcept;
    ~Document();

    /// @brief Creates an empty JSON object.
    static Document object();

    /// @brief Creates an empty JSON array.
    static Document array();

    /// @brief Deep-copies `source`; returns an empty handle when `source` is null.
    static Document copy_of(const cJSON* source);

    /**
     * @brief Parses JSON text.
     *
     * @return Document An empty handle if `text` is not valid JSON.
     */
    static Document parse(const std::string& text);

    /// @brief Borrowed access to the root. Ownership is retained.
    cJSON* get() const
    {
        return ptr_;
    }

    /// @brief Relinquishes ownership of the root to the caller.
    cJSON* release() noexcept
    {
        cJSON* raw = ptr_;
        ptr_ = nullptr;
        return raw;
    }

    explicit operator bool() const
    {
        return ptr_ != nullptr;
    }

    /// @brief Returns the member `key` of an object root, or `nullptr`.
    cJSON* operator[](const char* key) const;

    /// @brief Serializes the root without whitespace. Empty handles yield `"null"`.
    std::string dump() const;

    /// @brief Structural equality (object member order is ignored).
    bool equals(const Document& other) const;

  private:
    cJSON* ptr_ = nullptr;
};

/// @brief Serializes any cJSON value without whitespace (`"null"` for `nullptr`).
std::string to_json(const cJSON* value);

/**
 * @brief Returns the string `_id` of a stored document, or an empty string.
 */
std::string id_of(const cJSON* doc);

/**
 * @brief Reads a JSON number as a 64-bit integer.
 *
 * @return std::nullopt for non-numbers, NaN, infinities and values outside the
 * `std::int64_t` range. Fractions are truncated toward zero.
 */
std::optional<std::int64_t> integer_of(const cJSON* value);

} // namespace chronicle::storage
