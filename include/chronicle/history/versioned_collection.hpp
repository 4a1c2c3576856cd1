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
 * @file versioned_collection.hpp
 * @brief Temporal versioning of one record type.
 *
 * @details
 * A `VersionedCollection` owns nothing but configuration. Records live in the store's
 * `<name>` collection and their history in `<name>_deltas`. Every write goes through
 * `patch_one`, which diffs the incoming record against the stored one and atomically
 * writes the new live record together with the delta entries preserving the old state.
 *
 * @code
 * storage::DocumentStore store(logger);
 * history::VersionedCollection people(store, {"people", {"id"}});
 *
 * people.patch_one(storage::Document::parse(R"({"id": 1, "name": "Ada"})").get());
 * people.patch_one(storage::Document::parse(R"({"id": 1, "name": "Ada L."})").get());
 *
 * auto key = storage::Document::parse(R"({"id": 1})");
 * auto first = people.get_revision_by_version(key.get(), 1, 0); // name == "Ada"
 * @endcode
 */

#pragma once

#include "chronicle/history/chain_walker.hpp"
#include "chronicle/history/delta.hpp"
#include "chronicle/history/metadata.hpp"
#include "chronicle/infra/clock.hpp"
#include "chronicle/infra/logger.hpp"
#include "chronicle/storage/document.hpp"
#include "chronicle/storage/document_store.hpp"
#include "chronicle/storage/transaction.hpp"

#include <cJSON.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chronicle::history {

/// @brief Default name of the embedded metadata header.
inline constexpr const char* kDefaultMetadataKey = "__HISTORICAL_COLLECTION_INTERNAL_METADATA";

/**
 * @struct RecordType
 * @brief Declaration of a versioned record type.
 */
struct RecordType {
    /// @brief Live collection name (deltas go to `<name>_deltas`).
    std::string name;

    /// @brief Ordered, non-empty list of top-level primary key fields.
    std::vector<std::string> primary_key;
};

/**
 * @struct Options
 * @brief Engine configuration.
 */
struct Options {
    /// @brief Maximum chain distance between the live record and the nearest snapshot.
    int num_deltas_before_snapshot = 5;

    /// @brief Top-level key holding the metadata header (and the delta entry header).
    std::string internal_metadata_keyname = kDefaultMetadataKey;

    /// @brief Time source for every stamp.
    infra::Clock clock = infra::system_clock();

    /// @brief Consistency settings of every write transaction.
    storage::TransactionOptions transaction;
};

/**
 * @struct PatchOutcome
 * @brief What a non-no-op `patch_one` wrote.
 */
struct PatchOutcome {
    enum class Kind {
        CREATED,     ///< First write of the key: origin snapshot + live record.
        PATCHED,     ///< Reverse patch entry + live record.
        CHECKPOINTED ///< Reverse patch entry + snapshot entry + live record.
    };

    Kind kind = Kind::PATCHED;
    std::string record_id;

    /// @brief Newest delta entry written (the live record's new `previous_delta`).
    std::string delta_id;

    /// @brief Version of the live record after the write.
    Version version;
};

/// @brief `"created"`, `"patched"` or `"checkpointed"`.
const char* to_string(PatchOutcome::Kind kind);

/**
 * @struct PatchManyOptions
 * @brief Options of the bulk patch coordinator.
 */
struct PatchManyOptions {
    /// @brief Mark records absent from the batch as deleted.
    bool missing_mark_deleted = false;

    /// @brief Restricts which absent records may be marked (empty = all).
    storage::Document missing_mark_deleted_filter;

    /// @brief Caller metadata for every write of the batch (empty = null).
    storage::Document metadata;

    bool force = false;
    std::set<std::string> ignore_fields;
};

/**
 * @struct PatchManyResult
 * @brief Outcomes of the non-no-op patches plus the number of records marked deleted.
 */
struct PatchManyResult {
    std::vector<PatchOutcome> outcomes;
    std::size_t marked_deleted = 0;
};

/**
 * @struct EraseResult
 * @brief Counts removed by `delete_doc_and_patches`.
 */
struct EraseResult {
    std::size_t records = 0;
    std::size_t deltas = 0;
};

/**
 * @class VersionedCollection
 * @brief Patch/snapshot orchestrator, bulk coordinator and reconstruction facade.
 *
 * @details
 * **Thread Safety:** all methods may be called concurrently. Writes are serialized per
 * collection by the store's optimistic transactions; the callback of a conflicting
 * write is re-run against the newer state.
 */
class VersionedCollection {
  public:
    /**
     * @brief Binds a record type to a store.
     *
     * Creates the hash indexes the chain walks rely on.
     *
     * @param store Backing store (must outlive the collection).
     * @param type Record type declaration.
     * @param options Engine configuration.
     * @param logger Diagnostic sink; the store's logger when null.
     *
     * @throws ConfigurationError For an empty name or primary key, a primary key field
     * that is dotted or starts with `$`, an interval below 1, an empty or dotted metadata
     * key, or a missing clock.
     */
    VersionedCollection(storage::DocumentStore& store, RecordType type, Options options = {},
                        std::shared_ptr<infra::Logger> logger = nullptr);

    /**
     * @brief Writes `record` as the new state of its primary key.
     *
     * @param record Full field set of the record (top-level `_id` and metadata key are
     * ignored).
     * @param force Write a (possibly empty) patch even when nothing changed.
     * @param ignore_fields Field names excluded from the comparison.
     * @param metadata Caller metadata stored with the write (nullable).
     * @return std::optional<PatchOutcome> Empty for a no-op.
     *
     * @throws KeyConsistencyError If `record` lacks a primary key field.
     * @throws storage::TransactionError If the commit cannot be completed.
     */
    std::optional<PatchOutcome> patch_one(const cJSON* record, bool force = false,
                                          const std::set<std::string>& ignore_fields = {},
                                          const cJSON* metadata = nullptr);

    /**
     * @brief Patches every record of a batch, optionally marking absent records deleted.
     *
     * Each record commits on its own. The mark-deleted update runs after the last patch
     * and touches headers only.
     */
    PatchManyResult patch_many(const std::vector<storage::Document>& records,
                               const PatchManyOptions& options = {});

    /**
     * @brief Erases the live record and its whole delta chain in one transaction.
     */
    EraseResult delete_doc_and_patches(const cJSON* record);

    /// @brief The record as of time `at` (see `ChainWalker::as_of`).
    std::optional<storage::Document> get_revision_by_date(const cJSON* record,
                                                          infra::Timestamp at) const;

    /// @brief The first state of any record tagged `major.minor`.
    std::optional<storage::Document> get_revision_by_version(std::int64_t major,
                                                             std::int64_t minor) const;

    /// @brief The state of this record tagged `major.minor`.
    std::optional<storage::Document> get_revision_by_version(const cJSON* record,
                                                             std::int64_t major,
                                                             std::int64_t minor) const;

    /// @brief Chain entries of the record, newest first.
    std::vector<RevisionInfo> revisions(const cJSON* record) const;

    /// @brief The live record (header included), if any.
    std::optional<storage::Document> find_one(const cJSON* record) const;

    /**
     * @brief Builds the primary key equality filter of `record`.
     *
     * @throws KeyConsistencyError If a primary key field is missing or null.
     */
    storage::Document document_filter(const cJSON* record) const;

    const RecordType& type() const
    {
        return type_;
    }

    const Options& options() const
    {
        return options_;
    }

    /// @brief Name of the paired delta collection.
    const std::string& deltas_collection() const
    {
        return deltas_;
    }

  private:
    std::optional<PatchOutcome> create(storage::Session& session, const cJSON* record,
                                       const storage::Document& stored, infra::Timestamp now,
                                       const cJSON* metadata) const;
    bool checkpoint_due(storage::Session& session, const std::string& previous_delta) const;
    storage::Document content_of(const cJSON* record) const;
    storage::Document key_fields(const cJSON* record) const;

    storage::DocumentStore& store_;
    RecordType type_;
    Options options_;
    std::string deltas_;
    std::shared_ptr<infra::Logger> logger_;
    ChainWalker walker_;
};

} // namespace chronicle::history
