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
 * @file delta.cpp
 * @brief Delta entry serialization and reverse delta application.
 */

#include "chronicle/history/delta.hpp"

namespace chronicle::history {

using storage::Document;

namespace {

void set_member(cJSON* target, const char* name, const cJSON* value)
{
    cJSON* copy = cJSON_Duplicate(value, 1);
    if (cJSON_GetObjectItemCaseSensitive(target, name))
        cJSON_ReplaceItemInObjectCaseSensitive(target, name, copy);
    else
        cJSON_AddItemToObject(target, name, copy);
}

} // namespace

const char* to_string(DeltaType type)
{
    return type == DeltaType::SNAPSHOT ? "snapshot" : "patch";
}

// ============================================================================
//  DELTA SET
// ============================================================================

bool DeltaSet::empty() const
{
    return cJSON_GetArraySize(added.get()) == 0 && cJSON_GetArraySize(updated.get()) == 0 &&
           removed.empty();
}

Document DeltaSet::to_document() const
{
    Document out = Document::object();
    cJSON_AddItemToObject(out.get(), "ADD", cJSON_Duplicate(added.get(), 1));
    cJSON_AddItemToObject(out.get(), "UPDATE", cJSON_Duplicate(updated.get(), 1));
    cJSON* names = cJSON_AddArrayToObject(out.get(), "REMOVE");
    for (const auto& name : removed) {
        cJSON_AddItemToArray(names, cJSON_CreateString(name.c_str()));
    }
    return out;
}

DeltaSet DeltaSet::from_json(const cJSON* value)
{
    DeltaSet set;

    const cJSON* add = cJSON_GetObjectItemCaseSensitive(value, "ADD");
    if (cJSON_IsObject(add))
        set.added = Document::copy_of(add);

    const cJSON* update = cJSON_GetObjectItemCaseSensitive(value, "UPDATE");
    if (cJSON_IsObject(update))
        set.updated = Document::copy_of(update);

    const cJSON* names = cJSON_GetObjectItemCaseSensitive(value, "REMOVE");
    const cJSON* name = nullptr;
    cJSON_ArrayForEach(name, names)
    {
        if (cJSON_IsString(name) && name->valuestring)
            set.removed.emplace_back(name->valuestring);
    }
    return set;
}

void DeltaSet::apply(cJSON* target, infra::Logger& logger) const
{
    const cJSON* field = nullptr;
    cJSON_ArrayForEach(field, added.get())
    {
        set_member(target, field->string, field);
    }
    cJSON_ArrayForEach(field, updated.get())
    {
        set_member(target, field->string, field);
    }

    for (const auto& name : removed) {
        if (!cJSON_GetObjectItemCaseSensitive(target, name.c_str())) {
            logger.log(infra::LogLevel::WARN,
                       "Chain: REMOVE of absent field '" + name + "' skipped");
            continue;
        }
        cJSON_DeleteItemFromObjectCaseSensitive(target, name.c_str());
    }
}

// ============================================================================
//  DELTA ENTRY
// ============================================================================

Document DeltaEntry::to_document(const std::string& keyname) const
{
    Document out = Document::copy_of(fields.get());
    cJSON_AddStringToObject(out.get(), "_id", id.c_str());

    cJSON* header = cJSON_AddObjectToObject(out.get(), keyname.c_str());
    cJSON_AddStringToObject(header, "type", to_string(type));
    cJSON_AddItemToObject(header, "version", version.to_document().release());
    cJSON_AddNumberToObject(header, "timestamp", static_cast<double>(timestamp));
    if (!previous_delta.empty())
        cJSON_AddStringToObject(header, "previous_delta", previous_delta.c_str());
    cJSON_AddItemToObject(header, "metadata",
                          metadata ? cJSON_Duplicate(metadata.get(), 1) : cJSON_CreateNull());
    if (type == DeltaType::PATCH)
        cJSON_AddItemToObject(header, "deltas", deltas.to_document().release());
    return out;
}

std::optional<DeltaEntry> DeltaEntry::from_document(const cJSON* doc, const std::string& keyname)
{
    const cJSON* header = cJSON_GetObjectItemCaseSensitive(doc, keyname.c_str());
    const cJSON* type = cJSON_GetObjectItemCaseSensitive(header, "type");
    auto ts = storage::integer_of(cJSON_GetObjectItemCaseSensitive(header, "timestamp"));
    auto version = Version::from_json(cJSON_GetObjectItemCaseSensitive(header, "version"));
    if (!cJSON_IsString(type) || !ts || !version)
        return std::nullopt;

    std::string kind = type->valuestring;
    if (kind != "snapshot" && kind != "patch")
        return std::nullopt;

    DeltaEntry entry;
    entry.id = storage::id_of(doc);
    entry.type = kind == "snapshot" ? DeltaType::SNAPSHOT : DeltaType::PATCH;
    entry.version = *version;
    entry.timestamp = *ts;

    const cJSON* prev = cJSON_GetObjectItemCaseSensitive(header, "previous_delta");
    if (cJSON_IsString(prev) && prev->valuestring)
        entry.previous_delta = prev->valuestring;

    const cJSON* metadata = cJSON_GetObjectItemCaseSensitive(header, "metadata");
    if (metadata && !cJSON_IsNull(metadata))
        entry.metadata = Document::copy_of(metadata);

    if (entry.type == DeltaType::PATCH)
        entry.deltas = DeltaSet::from_json(cJSON_GetObjectItemCaseSensitive(header, "deltas"));

    entry.fields = Document::copy_of(doc);
    cJSON_DeleteItemFromObjectCaseSensitive(entry.fields.get(), "_id");
    cJSON_DeleteItemFromObjectCaseSensitive(entry.fields.get(), keyname.c_str());
    return entry;
}

Document RevisionInfo::to_document() const
{
    Document out = Document::object();
    cJSON_AddStringToObject(out.get(), "delta_id", delta_id.c_str());
    cJSON_AddStringToObject(out.get(), "type", to_string(type));
    cJSON_AddItemToObject(out.get(), "version", version.to_document().release());
    cJSON_AddNumberToObject(out.get(), "timestamp", static_cast<double>(timestamp));
    cJSON_AddItemToObject(out.get(), "metadata",
                          metadata ? cJSON_Duplicate(metadata.get(), 1) : cJSON_CreateNull());
    return out;
}

} // namespace chronicle::history
