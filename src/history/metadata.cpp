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
 * @file metadata.cpp
 * @brief Header (de)serialization and the state transition function.
 */

#include "chronicle/history/metadata.hpp"

#include <stdexcept>

namespace chronicle::history {

using storage::Document;

namespace {

cJSON* metadata_or_null(const Document& metadata)
{
    return metadata ? cJSON_Duplicate(metadata.get(), 1) : cJSON_CreateNull();
}

Document metadata_from(const cJSON* value)
{
    if (!value || cJSON_IsNull(value))
        return Document();
    return Document::copy_of(value);
}

} // namespace

Document Version::to_document() const
{
    Document out = Document::object();
    cJSON_AddNumberToObject(out.get(), "major", static_cast<double>(major));
    cJSON_AddNumberToObject(out.get(), "minor", static_cast<double>(minor));
    return out;
}

std::optional<Version> Version::from_json(const cJSON* value)
{
    const cJSON* major_item = cJSON_GetObjectItemCaseSensitive(value, "major");
    const cJSON* minor_item = cJSON_GetObjectItemCaseSensitive(value, "minor");
    auto major = storage::integer_of(major_item);
    auto minor = storage::integer_of(minor_item);
    if (!major || !minor)
        return std::nullopt;
    return Version{*major, *minor};
}

std::string Version::str() const
{
    return std::to_string(major) + "." + std::to_string(minor);
}

Document Stamp::to_document() const
{
    Document out = Document::object();
    cJSON_AddNumberToObject(out.get(), "timestamp", static_cast<double>(timestamp));
    cJSON_AddItemToObject(out.get(), "metadata", metadata_or_null(metadata));
    return out;
}

std::optional<Stamp> Stamp::from_json(const cJSON* value)
{
    auto ts = storage::integer_of(cJSON_GetObjectItemCaseSensitive(value, "timestamp"));
    if (!ts)
        return std::nullopt;

    Stamp stamp;
    stamp.timestamp = *ts;
    stamp.metadata = metadata_from(cJSON_GetObjectItemCaseSensitive(value, "metadata"));
    return stamp;
}

Document MetadataHeader::to_document() const
{
    Document out = Document::object();
    cJSON_AddStringToObject(out.get(), "previous_delta", previous_delta.c_str());
    cJSON_AddItemToObject(out.get(), "version", version.to_document().release());
    cJSON_AddItemToObject(out.get(), "created", created.to_document().release());
    cJSON_AddItemToObject(out.get(), "updated", updated.to_document().release());
    if (deleted)
        cJSON_AddItemToObject(out.get(), "deleted", deleted->to_document().release());
    else
        cJSON_AddNullToObject(out.get(), "deleted");
    return out;
}

std::optional<MetadataHeader> MetadataHeader::from_json(const cJSON* value)
{
    if (!cJSON_IsObject(value))
        return std::nullopt;

    auto version = Version::from_json(cJSON_GetObjectItemCaseSensitive(value, "version"));
    auto created = Stamp::from_json(cJSON_GetObjectItemCaseSensitive(value, "created"));
    auto updated = Stamp::from_json(cJSON_GetObjectItemCaseSensitive(value, "updated"));
    if (!version || !created || !updated)
        return std::nullopt;

    MetadataHeader header;
    header.version = *version;
    header.created = std::move(*created);
    header.updated = std::move(*updated);

    const cJSON* prev = cJSON_GetObjectItemCaseSensitive(value, "previous_delta");
    if (cJSON_IsString(prev) && prev->valuestring)
        header.previous_delta = prev->valuestring;

    const cJSON* deleted = cJSON_GetObjectItemCaseSensitive(value, "deleted");
    if (deleted && !cJSON_IsNull(deleted))
        header.deleted = Stamp::from_json(deleted);
    return header;
}

MetadataHeader advance(const std::optional<MetadataHeader>& prior, const Transition& transition)
{
    MetadataHeader next;

    if (const auto* created = std::get_if<Created>(&transition)) {
        next.previous_delta = created->origin_id;
        next.version = Version{1, 0};
        next.created = Stamp{created->now, created->metadata};
        next.updated = Stamp{created->now, created->metadata};
        return next;
    }

    if (!prior)
        throw std::logic_error("advance: a stored header is required for this transition");

    next.created = prior->created;

    if (const auto* patched = std::get_if<Patched>(&transition)) {
        next.previous_delta = patched->delta_id;
        next.version = Version{prior->version.major, prior->version.minor + 1};
        next.updated = Stamp{patched->now, patched->metadata};
    } else {
        const auto& snapshotted = std::get<Snapshotted>(transition);
        next.previous_delta = snapshotted.snapshot_id;
        next.version = Version{prior->version.major + 1, 0};
        next.updated = Stamp{snapshotted.now, snapshotted.metadata};
    }
    return next;
}

} // namespace chronicle::history
