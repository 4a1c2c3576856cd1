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
 * @file document.cpp
 * @brief Implementation of the owning cJSON handle.
 */

#include "chronicle/storage/document.hpp"

#include <cmath>
#include <cstdlib>
#include <utility>

namespace chronicle::storage {

Document::Document(const Document& other)
    : ptr_(other.ptr_ ? cJSON_Duplicate(other.ptr_, 1) : nullptr)
{
}

Document& Document::operator=(const Document& other)
{
    if (this != &other) {
        Document copy(other);
        std::swap(ptr_, copy.ptr_);
    }
    return *this;
}

Document& Document::operator=(Document&& other) noexcept
{
    if (this != &other) {
        if (ptr_)
            cJSON_Delete(ptr_);
        ptr_ = other.release();
    }
    return *this;
}

Document::~Document()
{
    if (ptr_)
        cJSON_Delete(ptr_);
}

Document Document::object()
{
    return Document(cJSON_CreateObject());
}

Document Document::array()
{
    return Document(cJSON_CreateArray());
}

Document Document::copy_of(const cJSON* source)
{
    return Document(source ? cJSON_Duplicate(source, 1) : nullptr);
}

Document Document::parse(const std::string& text)
{
    return Document(cJSON_Parse(text.c_str()));
}

cJSON* Document::operator[](const char* key) const
{
    if (!cJSON_IsObject(ptr_))
        return nullptr;
    return cJSON_GetObjectItemCaseSensitive(ptr_, key);
}

std::string Document::dump() const
{
    return to_json(ptr_);
}

bool Document::equals(const Document& other) const
{
    if (!ptr_ || !other.ptr_)
        return ptr_ == other.ptr_;
    return cJSON_Compare(ptr_, other.ptr_, 1) != 0;
}

std::string to_json(const cJSON* value)
{
    if (!value)
        return "null";
    char* raw = cJSON_PrintUnformatted(value);
    if (!raw)
        return "null";
    std::string out(raw);
    cJSON_free(raw);
    return out;
}

std::string id_of(const cJSON* doc)
{
    const cJSON* id = cJSON_GetObjectItemCaseSensitive(doc, "_id");
    if (cJSON_IsString(id) && id->valuestring)
        return id->valuestring;
    return "";
}

std::optional<std::int64_t> integer_of(const cJSON* value)
{
    if (!cJSON_IsNumber(value))
        return std::nullopt;
    double number = value->valuedouble;
    // 2^63 is exact in a double; anything at or beyond it does not fit.
    if (!std::isfinite(number) || number < -9223372036854775808.0 ||
        number >= 9223372036854775808.0)
        return std::nullopt;
    return static_cast<std::int64_t>(number);
}

} // namespace chronicle::storage
