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
 * @file chain_walker.hpp
 * @brief Read-only reconstruction of past record states.
 *
 * @details
 * The two reconstruction directions are deliberately different:
 * - **By timestamp** walks *backward* from the live record, applying reverse deltas
 *   newest to oldest until it reaches the requested point in time.
 * - **By version** locates the tagged entry directly, then walks *forward* to the nearest
 *   newer snapshot (or the live record) and applies the collected reverse deltas from that
 *   base back down to the target.
 *
 * Walks issue one store read per hop and take no snapshot across them.
 */

#pragma once

#include "chronicle/history/delta.hpp"
#include "chronicle/history/metadata.hpp"
#include "chronicle/infra/clock.hpp"
#include "chronicle/infra/logger.hpp"
#include "chronicle/storage/document.hpp"
#include "chronicle/storage/document_store.hpp"

#include <cJSON.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chronicle::history {

/**
 * @class ChainWalker
 * @brief Walks the delta chain of one record type.
 */
class ChainWalker {
  public:
    /**
     * @param store Backing store (outlives the walker).
     * @param collection Live collection name; deltas live in `<collection>_deltas`.
     * @param keyname Internal metadata key.
     * @param logger Sink for chain anomalies.
     */
    ChainWalker(const storage::DocumentStore& store, std::string collection, std::string keyname,
                std::shared_ptr<infra::Logger> logger);

    /**
     * @brief Reconstructs the record selected by `filter` as of time `at`.
     *
     * Entries written strictly before `at` belong to the result; an entry stamped exactly
     * `at` does not.
     *
     * @return std::nullopt When no live record matches or it was created after `at`.
     */
    std::optional<storage::Document> as_of(const cJSON* filter, infra::Timestamp at) const;

    /**
     * @brief Reconstructs the state tagged `version`.
     *
     * @param filter Primary key filter scoping the search, or `nullptr` for the first
     * entry of any record carrying the tag.
     * @return std::nullopt When the tag is unknown or its chain has no reachable base.
     */
    std::optional<storage::Document> as_of_version(const cJSON* filter, Version version) const;

    /**
     * @brief Lists chain entries newest first, from the live record to the origin.
     */
    std::vector<RevisionInfo> history(const cJSON* filter) const;

    /// @brief Loads and parses one entry by `_id`.
    std::optional<DeltaEntry> load(const std::string& id) const;

  private:
    storage::Document snapshot_base(const DeltaEntry& entry) const;
    storage::Document versioned_view(storage::Document content, const Version& version,
                                     const storage::Document& metadata) const;
    std::optional<storage::Document> live_at_version(const cJSON* filter,
                                                     const Version& version) const;

    const storage::DocumentStore& store_;
    std::string collection_;
    std::string deltas_;
    std::string keyname_;
    std::shared_ptr<infra::Logger> logger_;
};

} // namespace chronicle::history
