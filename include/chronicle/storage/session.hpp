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
 * @file session.hpp
 * @brief Transaction handle passed to `DocumentStore::run_in_transaction` callbacks.
 *
 * @details
 * A `Session` buffers every write of one transaction attempt in private overlays and
 * serves reads as "committed state plus my own writes". Nothing becomes visible to other
 * sessions until the store commits the attempt. Each read records the generation of the
 * collection it observed; the commit is rejected (and the callback retried) if any of
 * those collections changed in the meantime.
 */

#pragma once

#include "chronicle/storage/document.hpp"
#include "chronicle/storage/transaction.hpp"

#include <cJSON.h>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace chronicle::storage {

class DocumentStore;

/**
 * @class Session
 * @brief CRUD surface of a single transaction attempt.
 *
 * @note A session is confined to the thread running the callback and must not escape it.
 */
class Session {
  public:
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * @brief Returns the first document matching `filter`, or an empty handle.
     */
    Document find_one(const std::string& collection, const cJSON* filter);

    /**
     * @brief Returns every document matching `filter`.
     *
     * @param limit Maximum number of results (0 = unlimited).
     */
    std::vector<Document> find(const std::string& collection, const cJSON* filter,
                               std::size_t limit = 0);

    /**
     * @brief Stages a new document.
     *
     * An `_id` is generated when the document carries none.
     *
     * @throws DuplicateKeyError If the `_id` is already present.
     * @throws std::invalid_argument If `doc` is not an object or its `_id` is not a string.
     */
    InsertResult insert_one(const std::string& collection, const cJSON* doc);

    /**
     * @brief Stages a full replacement of the first document matching `filter`.
     *
     * The stored `_id` is preserved.
     *
     * @throws std::invalid_argument If `replacement` tries to change the `_id`.
     */
    UpdateResult replace_one(const std::string& collection, const cJSON* filter,
                             const cJSON* replacement);

    /// @brief Stages `update` (a `$set`/`$unset` document) on every match.
    UpdateResult update_many(const std::string& collection, const cJSON* filter,
                             const cJSON* update);

    /// @brief Stages the removal of every match.
    DeleteResult delete_many(const std::string& collection, const cJSON* filter);

    const TransactionOptions& options() const
    {
        return options_;
    }

  private:
    friend class DocumentStore;

    /**
     * @brief Private writes of one collection.
     *
     * An empty `Document` marks an erased `_id`. `order` keeps first-touch order so that
     * reads and the journal record are deterministic.
     */
    struct Overlay {
        std::unordered_map<std::string, Document> docs;
        std::vector<std::string> order;
    };

    Session(DocumentStore& store, const TransactionOptions& options);

    void stage(const std::string& collection, const std::string& id, Document doc);
    const Overlay* overlay(const std::string& collection) const;

    DocumentStore& store_;
    TransactionOptions options_;

    /// @brief Collection -> generation at first read.
    std::unordered_map<std::string, std::uint64_t> observed_;

    /// @brief Collection -> staged writes (ordered for a stable commit record).
    std::map<std::string, Overlay> overlays_;
};

} // namespace chronicle::storage
