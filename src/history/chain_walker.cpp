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
 * @file chain_walker.cpp
 * @brief Implementation of timestamp and version reconstruction.
 */

#include "chronicle/history/chain_walker.hpp"

#include <utility>

namespace chronicle::history {

using storage::Document;

namespace {

Document scoped_filter(const cJSON* filter)
{
    return filter ? Document::copy_of(filter) : Document::object();
}

void add_version_clause(cJSON* query, const std::string& keyname, const Version& version)
{
    cJSON_AddNumberToObject(query, (keyname + ".version.major").c_str(),
                            static_cast<double>(version.major));
    cJSON_AddNumberToObject(query, (keyname + ".version.minor").c_str(),
                            static_cast<double>(version.minor));
}

} // namespace

ChainWalker::ChainWalker(const storage::DocumentStore& store, std::string collection,
                         std::string keyname, std::shared_ptr<infra::Logger> logger)
    : store_(store), collection_(std::move(collection)), deltas_(collection_ + "_deltas"),
      keyname_(std::move(keyname)), logger_(std::move(logger))
{
}

std::optional<DeltaEntry> ChainWalker::load(const std::string& id) const
{
    Document lookup = Document::object();
    cJSON_AddStringToObject(lookup.get(), "_id", id.c_str());

    Document doc = store_.find_one(deltas_, lookup.get());
    if (!doc)
        return std::nullopt;
    return DeltaEntry::from_document(doc.get(), keyname_);
}

Document ChainWalker::snapshot_base(const DeltaEntry& entry) const
{
    return Document::copy_of(entry.fields.get());
}

Document ChainWalker::versioned_view(Document content, const Version& version,
                                     const Document& metadata) const
{
    cJSON_DeleteItemFromObjectCaseSensitive(content.get(), "_id");
    cJSON_DeleteItemFromObjectCaseSensitive(content.get(), keyname_.c_str());

    cJSON* header = cJSON_AddObjectToObject(content.get(), keyname_.c_str());
    cJSON_AddItemToObject(header, "version", version.to_document().release());
    cJSON_AddItemToObject(header, "metadata",
                          metadata ? cJSON_Duplicate(metadata.get(), 1) : cJSON_CreateNull());
    return content;
}

// ============================================================================
//  BY TIMESTAMP (backward)
// ============================================================================

/**
 * @brief Backward walk from the live record.
 *
 * **Per entry, newest first:**
 * 1. **Boundary** (`timestamp < at`): a snapshot becomes the base; a patch is left
 * unapplied because its write precedes `at`. The walk stops.
 * 2. **Newer snapshot:** becomes the base; reverse deltas gathered so far are superseded.
 * 3. **Newer patch:** its reverse delta is queued.
 *
 * Queued deltas are then applied in queue order (newest to oldest).
 */
std::optional<Document> ChainWalker::as_of(const cJSON* filter, infra::Timestamp at) const
{
    Document live = store_.find_one(collection_, filter);
    if (!live)
        return std::nullopt;

    auto header = MetadataHeader::from_json(live[keyname_.c_str()]);
    if (!header) {
        logger_->log(infra::LogLevel::WARN, "Chain: Live record " + storage::id_of(live.get()) +
                                                " of " + collection_ + " has no header");
        return std::nullopt;
    }
    if (header->created.timestamp > at)
        return std::nullopt;

    const std::string live_id = storage::id_of(live.get());
    Document base = std::move(live);
    std::vector<DeltaSet> pending;

    std::string cursor = header->previous_delta;
    while (!cursor.empty()) {
        auto entry = load(cursor);
        if (!entry) {
            logger_->log(infra::LogLevel::WARN, "Chain: Dangling previous_delta " + cursor +
                                                    " in " + deltas_ + "; walk truncated");
            break;
        }

        if (entry->timestamp < at) {
            if (entry->type == DeltaType::SNAPSHOT) {
                base = snapshot_base(*entry);
                pending.clear();
            }
            break;
        }

        if (entry->type == DeltaType::SNAPSHOT) {
            base = snapshot_base(*entry);
            pending.clear();
        } else {
            pending.push_back(std::move(entry->deltas));
        }
        cursor = entry->previous_delta;
    }

    for (const auto& delta : pending) {
        delta.apply(base.get(), *logger_);
    }

    cJSON_DeleteItemFromObjectCaseSensitive(base.get(), keyname_.c_str());
    if (!cJSON_GetObjectItemCaseSensitive(base.get(), "_id"))
        cJSON_AddStringToObject(base.get(), "_id", live_id.c_str());
    return base;
}

// ============================================================================
//  BY VERSION (forward)
// ============================================================================

std::optional<Document> ChainWalker::live_at_version(const cJSON* filter,
                                                     const Version& version) const
{
    Document query = scoped_filter(filter);
    add_version_clause(query.get(), keyname_, version);

    Document live = store_.find_one(collection_, query.get());
    if (!live)
        return std::nullopt;

    auto header = MetadataHeader::from_json(live[keyname_.c_str()]);
    if (!header)
        return std::nullopt;
    return versioned_view(std::move(live), header->version, header->updated.metadata);
}

/**
 * @brief Direct lookup followed by a forward walk.
 *
 * A checkpoint leaves a snapshot and a patch sharing one tag; the snapshot wins because
 * it needs no walk at all.
 */
std::optional<Document> ChainWalker::as_of_version(const cJSON* filter, Version version) const
{
    Document query = scoped_filter(filter);
    add_version_clause(query.get(), keyname_, version);

    std::optional<DeltaEntry> target;
    for (const Document& doc : store_.find(deltas_, query.get())) {
        auto entry = DeltaEntry::from_document(doc.get(), keyname_);
        if (!entry)
            continue;
        if (entry->type == DeltaType::SNAPSHOT) {
            target = std::move(entry);
            break;
        }
        if (!target)
            target = std::move(entry);
    }

    if (!target)
        return live_at_version(filter, version);

    if (target->type == DeltaType::SNAPSHOT)
        return versioned_view(snapshot_base(*target), target->version, target->metadata);

    std::vector<DeltaEntry> collected;
    collected.push_back(std::move(*target));

    Document base;
    while (!base) {
        Document lookup = Document::object();
        cJSON_AddStringToObject(lookup.get(), (keyname_ + ".previous_delta").c_str(),
                                collected.back().id.c_str());

        Document next = store_.find_one(deltas_, lookup.get());
        if (next) {
            auto entry = DeltaEntry::from_document(next.get(), keyname_);
            if (!entry) {
                logger_->log(infra::LogLevel::WARN, "Chain: Malformed entry " +
                                                        storage::id_of(next.get()) + " in " +
                                                        deltas_);
                return std::nullopt;
            }
            if (entry->type == DeltaType::SNAPSHOT)
                base = snapshot_base(*entry);
            else
                collected.push_back(std::move(*entry));
            continue;
        }

        Document live = store_.find_one(collection_, lookup.get());
        if (!live) {
            logger_->log(infra::LogLevel::WARN, "Chain: No base reachable from " +
                                                    collected.back().id + " in " + deltas_);
            return std::nullopt;
        }
        base = std::move(live);
    }

    Version reached = collected.back().version;
    Document metadata;
    for (auto it = collected.rbegin(); it != collected.rend(); ++it) {
        it->deltas.apply(base.get(), *logger_);
        reached = it->version;
        metadata = it->metadata;
    }
    return versioned_view(std::move(base), reached, metadata);
}

// ============================================================================
//  REVISION LISTING
// ============================================================================

std::vector<RevisionInfo> ChainWalker::history(const cJSON* filter) const
{
    std::vector<RevisionInfo> out;

    Document live = store_.find_one(collection_, filter);
    if (!live)
        return out;

    auto header = MetadataHeader::from_json(live[keyname_.c_str()]);
    if (!header)
        return out;

    std::string cursor = header->previous_delta;
    while (!cursor.empty()) {
        auto entry = load(cursor);
        if (!entry) {
            logger_->log(infra::LogLevel::WARN, "Chain: Dangling previous_delta " + cursor +
                                                    " in " + deltas_ + "; listing truncated");
            break;
        }

        RevisionInfo info;
        info.delta_id = entry->id;
        info.type = entry->type;
        info.version = entry->version;
        info.timestamp = entry->timestamp;
        info.metadata = std::move(entry->metadata);
        out.push_back(std::move(info));

        cursor = entry->previous_delta;
    }
    return out;
}

} // namespace chronicle::history
