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
 * @file diff.cpp
 * @brief Implementation of the three-way field difference.
 */

#include "chronicle/history/diff.hpp"

#include "chronicle/history/errors.hpp"

#include <utility>

namespace chronicle::history {

using storage::Document;

DiffEngine::DiffEngine(std::vector<std::string> primary_key, std::set<std::string> ignored)
    : primary_key_(std::move(primary_key)), ignored_(std::move(ignored))
{
    ignored_.insert("_id");
}

bool DiffEngine::ignored(const char* name) const
{
    return name == nullptr || ignored_.count(name) != 0;
}

void DiffEngine::check_key(const cJSON* a, const cJSON* b) const
{
    for (const auto& field : primary_key_) {
        const cJSON* left = cJSON_GetObjectItemCaseSensitive(a, field.c_str());
        const cJSON* right = cJSON_GetObjectItemCaseSensitive(b, field.c_str());
        if (!left || cJSON_IsNull(left) || !right || cJSON_IsNull(right)) {
            throw KeyConsistencyError(field, storage::to_json(left), storage::to_json(right));
        }
        if (!cJSON_Compare(left, right, 1)) {
            throw KeyConsistencyError(field, storage::to_json(left), storage::to_json(right));
        }
    }
}

Document DiffEngine::additions(const cJSON* a, const cJSON* b) const
{
    check_key(a, b);

    Document out = Document::object();
    const cJSON* field = nullptr;
    cJSON_ArrayForEach(field, b)
    {
        if (ignored(field->string))
            continue;
        if (!cJSON_GetObjectItemCaseSensitive(a, field->string))
            cJSON_AddItemToObject(out.get(), field->string, cJSON_Duplicate(field, 1));
    }
    return out;
}

std::vector<std::string> DiffEngine::removals(const cJSON* a, const cJSON* b) const
{
    check_key(a, b);

    std::vector<std::string> out;
    const cJSON* field = nullptr;
    cJSON_ArrayForEach(field, a)
    {
        if (ignored(field->string))
            continue;
        if (!cJSON_GetObjectItemCaseSensitive(b, field->string))
            out.emplace_back(field->string);
    }
    return out;
}

Document DiffEngine::updates(const cJSON* a, const cJSON* b) const
{
    Document out = Document::object();
    const cJSON* field = nullptr;
    cJSON_ArrayForEach(field, a)
    {
        if (ignored(field->string))
            continue;
        const cJSON* older = cJSON_GetObjectItemCaseSensitive(b, field->string);
        if (older && !cJSON_Compare(field, older, 1))
            cJSON_AddItemToObject(out.get(), field->string, cJSON_Duplicate(older, 1));
    }
    return out;
}

DeltaSet DiffEngine::compute(const cJSON* a, const cJSON* b) const
{
    DeltaSet set;
    set.added = additions(a, b);
    set.removed = removals(a, b);
    set.updated = updates(a, b);
    return set;
}

} // namespace chronicle::history
