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
 * @file versioned_collection.cpp
 * @brief Implementation of the patch/snapshot orchestrator.
 *
 * @details
 * Every write is one store transaction. The callback re-reads the stored record and the
 * clock on each attempt, so a retried write always diffs against the latest state.
 */

#include "chronicle/history/versioned_collection.hpp"

#include "chronicle/history/diff.hpp"
#include "chronicle/history/errors.hpp"
#include "chronicle/infra/id_generator.hpp"

#include <utility>

namespace chronicle::history {

using storage::Document;
using storage::Session;

namespace {

void validate_field_name(const std::string& field, const char* what)
{
    if (field.empty() || field.find('.') != std::string::npos || field[0] == '$') {
        throw ConfigurationError(std::string(what) + " '" + field +
                                 "' must be non-empty, undotted and not start with '$'");
    }
}

Document id_filter(const std::string& id)
{
    Document filter = Document::object();
    cJSON_AddStringToObject(filter.get(), "_id", id.c_str());
    return filter;
}

} // namespace

const char* to_string(PatchOutcome::Kind kind)
{
    switch (kind) {
    case PatchOutcome::Kind::CREATED:
        return "created";
    case PatchOutcome::Kind::PATCHED:
        return "patched";
    case PatchOutcome::Kind::CHECKPOINTED:
        return "checkpointed";
    }
    return "unknown";
}

VersionedCollection::VersionedCollection(storage::DocumentStore& store, RecordType type,
                                         Options options, std::shared_ptr<infra::Logger> logger)
    : store_(store), type_(std::move(type)), options_(std::move(options)),
      deltas_(type_.name + "_deltas"), logger_(logger ? std::move(logger) : store.logger()),
      walker_(store_, type_.name, options_.internal_metadata_keyname, logger_)
{
    if (type_.name.empty() || type_.name[0] == '_')
        throw ConfigurationError("Record type name must be non-empty and not start with '_'");
    if (type_.primary_key.empty())
        throw ConfigurationError("Record type '" + type_.name + "' needs a primary key");
    for (const auto& field : type_.primary_key) {
        validate_field_name(field, "Primary key field");
        if (field == "_id" || field == options_.internal_metadata_keyname)
            throw ConfigurationError("Primary key field '" + field + "' is reserved");
    }
    if (options_.num_deltas_before_snapshot < 1)
        throw ConfigurationError("num_deltas_before_snapshot must be at least 1");
    validate_field_name(options_.internal_metadata_keyname, "Metadata key");
    if (!options_.clock)
        throw ConfigurationError("A clock is required");

    const std::string link = options_.internal_metadata_keyname + ".previous_delta";
    store_.create_index(deltas_, link);
    store_.create_index(type_.name, link);
}

// ============================================================================
//  HELPERS
// ============================================================================

Document VersionedCollection::document_filter(const cJSON* record) const
{
    Document filter = Document::object();
    for (const auto& field : type_.primary_key) {
        const cJSON* value = cJSON_GetObjectItemCaseSensitive(record, field.c_str());
        if (!value || cJSON_IsNull(value))
            throw KeyConsistencyError(field);
        cJSON_AddItemToObject(filter.get(), field.c_str(), cJSON_Duplicate(value, 1));
    }
    return filter;
}

Document VersionedCollection::content_of(const cJSON* record) const
{
    Document content = Document::copy_of(record);
    cJSON_DeleteItemFromObjectCaseSensitive(content.get(), "_id");
    cJSON_DeleteItemFromObjectCaseSensitive(content.get(),
                                            options_.internal_metadata_keyname.c_str());
    return content;
}

Document VersionedCollection::key_fields(const cJSON* record) const
{
    return document_filter(record);
}

/**
 * @brief Searches the last `interval - 1` entries behind the stored record for a snapshot.
 *
 * A truncated chain counts as "no snapshot", which forces a checkpoint and repairs the
 * reachability guarantee for the records written from now on.
 */
bool VersionedCollection::checkpoint_due(Session& session,
                                         const std::string& previous_delta) const
{
    std::string cursor = previous_delta;
    for (int hop = 0; hop < options_.num_deltas_before_snapshot - 1; ++hop) {
        if (cursor.empty())
            return true;

        Document doc = session.find_one(deltas_, id_filter(cursor).get());
        auto entry = doc ? DeltaEntry::from_document(doc.get(), options_.internal_metadata_keyname)
                         : std::nullopt;
        if (!entry) {
            logger_->log(infra::LogLevel::WARN, "Chain: Dangling previous_delta " + cursor +
                                                    " in " + deltas_ + "; forcing checkpoint");
            return true;
        }
        if (entry->type == DeltaType::SNAPSHOT)
            return false;
        cursor = entry->previous_delta;
    }
    return true;
}

// ============================================================================
//  ORCHESTRATOR
// ============================================================================

std::optional<PatchOutcome> VersionedCollection::create(Session& session, const cJSON* record,
                                                        const Document& stored,
                                                        infra::Timestamp now,
                                                        const cJSON* metadata) const
{
    const std::string& keyname = options_.internal_metadata_keyname;

    DeltaEntry origin;
    origin.id = infra::IdGenerator::generate();
    origin.type = DeltaType::SNAPSHOT;
    origin.version = Version{0, 0};
    origin.timestamp = now;
    origin.fields = content_of(record);
    session.insert_one(deltas_, origin.to_document(keyname).get());

    MetadataHeader header =
        advance(std::nullopt, Created{origin.id, now, Document::copy_of(metadata)});

    Document live = content_of(record);
    cJSON_AddItemToObject(live.get(), keyname.c_str(), header.to_document().release());

    PatchOutcome outcome;
    outcome.kind = PatchOutcome::Kind::CREATED;
    outcome.delta_id = origin.id;
    outcome.version = header.version;

    if (stored) {
        // Adopt a pre-existing, unversioned document under the same key.
        outcome.record_id = storage::id_of(stored.get());
        session.replace_one(type_.name, id_filter(outcome.record_id).get(), live.get());
        logger_->log(infra::LogLevel::DEBUG,
                     "History: Adopted unversioned record " + outcome.record_id);
    } else {
        outcome.record_id = session.insert_one(type_.name, live.get()).inserted_id;
    }
    return outcome;
}

/**
 * @brief Decides between no-op, patch and checkpoint, and writes the result.
 *
 * **Write Set (one transaction):**
 * - `CREATED`: origin snapshot `{0, 0}` + live record `{1, 0}`.
 * - `PATCHED`: reverse patch tagged with the stored version + live record.
 * - `CHECKPOINTED`: the same reverse patch + a snapshot of the incoming state tagged
 *   `{major + 1, 0}` + live record.
 */
std::optional<PatchOutcome> VersionedCollection::patch_one(const cJSON* record, bool force,
                                                           const std::set<std::string>& ignore_fields,
                                                           const cJSON* metadata)
{
    if (!cJSON_IsObject(record))
        throw std::invalid_argument("patch_one expects a JSON object");

    const Document filter = document_filter(record);
    const std::string& keyname = options_.internal_metadata_keyname;

    std::set<std::string> ignored(ignore_fields);
    ignored.insert(keyname);
    const DiffEngine diff(type_.primary_key, std::move(ignored));

    return store_.run_in_transaction(
        [&](Session& session) -> std::optional<PatchOutcome> {
            const infra::Timestamp now = options_.clock();
            Document stored = session.find_one(type_.name, filter.get());

            std::optional<MetadataHeader> header;
            if (stored)
                header = MetadataHeader::from_json(stored[keyname.c_str()]);
            if (!header)
                return create(session, record, stored, now, metadata);

            DeltaSet reverse = diff.compute(record, stored.get());
            if (reverse.empty() && !force) {
                logger_->log(infra::LogLevel::TRACE,
                             "History: No change for " + storage::id_of(stored.get()));
                return std::nullopt;
            }

            DeltaEntry patch;
            patch.id = infra::IdGenerator::generate();
            patch.type = DeltaType::PATCH;
            patch.version = header->version;
            patch.timestamp = now;
            patch.previous_delta = header->previous_delta;
            patch.metadata = header->updated.metadata;
            patch.deltas = std::move(reverse);
            patch.fields = key_fields(record);
            session.insert_one(deltas_, patch.to_document(keyname).get());

            PatchOutcome outcome;
            outcome.record_id = storage::id_of(stored.get());

            MetadataHeader next;
            if (!checkpoint_due(session, header->previous_delta)) {
                next = advance(header, Patched{patch.id, now, Document::copy_of(metadata)});
                outcome.kind = PatchOutcome::Kind::PATCHED;
                outcome.delta_id = patch.id;
            } else {
                DeltaEntry snapshot;
                snapshot.id = infra::IdGenerator::generate();
                snapshot.type = DeltaType::SNAPSHOT;
                snapshot.version = Version{header->version.major + 1, 0};
                snapshot.timestamp = now;
                snapshot.previous_delta = patch.id;
                snapshot.metadata = Document::copy_of(metadata);
                snapshot.fields = content_of(record);
                session.insert_one(deltas_, snapshot.to_document(keyname).get());

                next = advance(header, Snapshotted{snapshot.id, now, Document::copy_of(metadata)});
                outcome.kind = PatchOutcome::Kind::CHECKPOINTED;
                outcome.delta_id = snapshot.id;
            }
            outcome.version = next.version;

            Document live = content_of(record);
            cJSON_AddItemToObject(live.get(), keyname.c_str(), next.to_document().release());
            session.replace_one(type_.name, id_filter(outcome.record_id).get(), live.get());
            return outcome;
        },
        options_.transaction);
}

// ============================================================================
//  BULK COORDINATOR
// ============================================================================

/**
 * @brief Applies a batch, then soft-deletes the records the batch no longer mentions.
 *
 * The mark-deleted filter is
 * `{"$and": [caller_filter, {"<key>.deleted": null}, {"<key>": {"$exists": true}},
 * {"$nor": [pk tuple, ...]}]}`, so a record is spared only when its whole key tuple
 * appears in the batch.
 */
PatchManyResult VersionedCollection::patch_many(const std::vector<Document>& records,
                                                const PatchManyOptions& options)
{
    PatchManyResult result;
    Document seen = Document::array();

    for (const Document& record : records) {
        cJSON_AddItemToArray(seen.get(), document_filter(record.get()).release());
        auto outcome =
            patch_one(record.get(), options.force, options.ignore_fields, options.metadata.get());
        if (outcome)
            result.outcomes.push_back(std::move(*outcome));
    }

    if (!options.missing_mark_deleted)
        return result;

    const std::string& keyname = options_.internal_metadata_keyname;

    Document filter = Document::object();
    cJSON* clauses = cJSON_AddArrayToObject(filter.get(), "$and");
    if (options.missing_mark_deleted_filter)
        cJSON_AddItemToArray(clauses,
                             cJSON_Duplicate(options.missing_mark_deleted_filter.get(), 1));

    cJSON* live_only = cJSON_CreateObject();
    cJSON_AddNullToObject(live_only, (keyname + ".deleted").c_str());
    cJSON_AddItemToArray(clauses, live_only);

    cJSON* versioned = cJSON_CreateObject();
    cJSON_AddTrueToObject(cJSON_AddObjectToObject(versioned, keyname.c_str()), "$exists");
    cJSON_AddItemToArray(clauses, versioned);

    cJSON* absent = cJSON_CreateObject();
    cJSON_AddItemToObject(absent, "$nor", seen.release());
    cJSON_AddItemToArray(clauses, absent);

    Document stamp = Stamp{options_.clock(), options.metadata}.to_document();
    Document update = Document::object();
    cJSON* set = cJSON_AddObjectToObject(update.get(), "$set");
    cJSON_AddItemToObject(set, (keyname + ".deleted").c_str(), stamp.release());

    result.marked_deleted = store_.update_many(type_.name, filter.get(), update.get()).modified_count;
    if (result.marked_deleted > 0) {
        logger_->log(infra::LogLevel::INFO, "History: Marked " +
                                                std::to_string(result.marked_deleted) +
                                                " record(s) of " + type_.name + " deleted");
    }
    return result;
}

EraseResult VersionedCollection::delete_doc_and_patches(const cJSON* record)
{
    const Document filter = document_filter(record);

    return store_.run_in_transaction(
        [&](Session& session) {
            EraseResult erased;
            erased.records = session.delete_many(type_.name, filter.get()).deleted_count;
            erased.deltas = session.delete_many(deltas_, filter.get()).deleted_count;
            return erased;
        },
        options_.transaction);
}

// ============================================================================
//  READ FACADE
// ============================================================================

std::optional<Document> VersionedCollection::get_revision_by_date(const cJSON* record,
                                                                  infra::Timestamp at) const
{
    return walker_.as_of(document_filter(record).get(), at);
}

std::optional<Document> VersionedCollection::get_revision_by_version(std::int64_t major,
                                                                     std::int64_t minor) const
{
    return walker_.as_of_version(nullptr, Version{major, minor});
}

std::optional<Document> VersionedCollection::get_revision_by_version(const cJSON* record,
                                                                     std::int64_t major,
                                                                     std::int64_t minor) const
{
    return walker_.as_of_version(document_filter(record).get(), Version{major, minor});
}

std::vector<RevisionInfo> VersionedCollection::revisions(const cJSON* record) const
{
    return walker_.history(document_filter(record).get());
}

std::optional<Document> VersionedCollection::find_one(const cJSON* record) const
{
    Document live = store_.find_one(type_.name, document_filter(record).get());
    if (!live)
        return std::nullopt;
    return live;
}

} // namespace chronicle::history
