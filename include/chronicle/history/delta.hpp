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
 * @file delta.hpp
 * @brief Delta chain entries and their payloads.
 *
 * @details
 * Entries live in the `<record-type>_deltas` collection. Primary key fields sit at top
 * level; everything else the engine needs is nested under the internal metadata key:
 *
 * ```json
 * {
 *   "_id": "6716a8f2c41d9e07ab000004",
 *   "id": 1,
 *   "__HISTORICAL_COLLECTION_INTERNAL_METADATA": {
 *     "type": "patch",
 *     "version": {"major": 1, "minor": 1},
 *     "timestamp": 1700000600000,
 *     "previous_delta": "6716a8f2c41d9e07ab000002",
 *     "metadata": null,
 *     "deltas": {"ADD": {}, "UPDATE": {"a": 1}, "REMOVE": ["b"]}
 *   }
 * }
 * ```
 *
 * A `snapshot` entry carries the full field set of the record instead of `deltas`.
 */

#pragma once

#include "chronicle/history/metadata.hpp"
#include "chronicle/infra/clock.hpp"
#include "chronicle/infra/logger.hpp"
#include "chronicle/storage/document.hpp"

#include <cJSON.h>
#include <optional>
#include <string>
#include <vector>

namespace chronicle::history {

/**
 * @enum DeltaType
 * @brief Kind of a delta chain entry.
 */
enum class DeltaType {
    SNAPSHOT, ///< Full field set of the record.
    PATCH     ///< Reverse delta from the following state to this one.
};

/// @brief `"snapshot"` or `"patch"`.
const char* to_string(DeltaType type);

/**
 * @struct DeltaSet
 * @brief Field-level reverse delta.
 *
 * Applying it to the state after a write yields the state before that write.
 */
struct DeltaSet {
    /// @brief Fields to (re)introduce, with their values (`ADD`).
    storage::Document added = storage::Document::object();

    /// @brief Fields to overwrite, with their values (`UPDATE`).
    storage::Document updated = storage::Document::object();

    /// @brief Fields to drop (`REMOVE`).
    std::vector<std::string> removed;

    bool empty() const;

    /// @brief `{"ADD": {...}, "UPDATE": {...}, "REMOVE": [...]}`.
    storage::Document to_document() const;

    /// @brief Parses the payload; missing sections are treated as empty.
    static DeltaSet from_json(const cJSON* value);

    /**
     * @brief Applies the delta to `target` in place.
     *
     * `ADD` and `UPDATE` members are set first, then `REMOVE` names are dropped. Removing
     * a field that is not present is logged at WARN and skipped.
     */
    void apply(cJSON* target, infra::Logger& logger) const;
};

/**
 * @struct DeltaEntry
 * @brief In-memory form of one immutable delta chain entry.
 */
struct DeltaEntry {
    std::string id;
    DeltaType type = DeltaType::PATCH;
    Version version;
    infra::Timestamp timestamp = 0;

    /// @brief Older neighbour in the chain; empty for the origin snapshot.
    std::string previous_delta;

    /// @brief Caller metadata of the state this entry preserves (empty = null).
    storage::Document metadata;

    /// @brief Reverse delta (`PATCH` only).
    DeltaSet deltas;

    /**
     * @brief Top-level record fields.
     *
     * The full field set for a `SNAPSHOT`, the primary key fields for a `PATCH`.
     * Never contains `_id` or the metadata key.
     */
    storage::Document fields = storage::Document::object();

    /// @brief Serializes the entry as stored in the deltas collection.
    storage::Document to_document(const std::string& keyname) const;

    /**
     * @brief Parses a stored entry.
     *
     * @return std::nullopt When the document lacks a well-formed header under `keyname`.
     */
    static std::optional<DeltaEntry> from_document(const cJSON* doc, const std::string& keyname);
};

/**
 * @struct RevisionInfo
 * @brief Summary of one chain entry as reported by `VersionedCollection::revisions`.
 */
struct RevisionInfo {
    std::string delta_id;
    DeltaType type = DeltaType::PATCH;
    Version version;
    infra::Timestamp timestamp = 0;
    storage::Document metadata;

    storage::Document to_document() const;
};

} // namespace chronicle::history
