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
 * @file document_store.hpp
 * @brief Embedded transactional document store.
 *
 * @details
 * This header defines the `DocumentStore` class, the storage backend the versioning
 * engine is layered on. It keeps named collections of JSON documents in memory, persists
 * every commit to a journal through the `Engine`, and executes multi-document
 * transactions with optimistic validation and transparent retry.
 */

#pragma once

#include "chronicle/infra/logger.hpp"
#include "chronicle/storage/document.hpp"
#include "chronicle/storage/engine.hpp"
#include "chronicle/storage/session.hpp"
#include "chronicle/storage/transaction.hpp"

#include <cJSON.h>
#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace chronicle::storage {

/**
 * @class DocumentStore
 * @brief The database controller managing memory, persistence and transactions.
 *
 * @details
 * **Core Responsibilities:**
 * - **Concurrency Control:** `std::shared_mutex` guards committed state; readers share,
 * commits are exclusive. Callbacks themselves run without holding the lock.
 * - **Isolation:** every collection carries a generation counter bumped by each commit
 * that writes it. A transaction commits only if the generations it read are unchanged,
 * which makes committed transactions serializable.
 * - **Memory Management:** collections are cJSON arrays with an `_id` hash index and
 * optional secondary hash indexes on dotted fields.
 * - **Persistence:** each commit is one journal frame; the constructor replays the journal.
 *
 * A store built without a data directory is ephemeral (no journal).
 */
class DocumentStore {
  public:
    /**
     * @brief Creates an ephemeral, memory-only store.
     */
    explicit DocumentStore(std::shared_ptr<infra::Logger> logger);

    /**
     * @brief Opens (or creates) a persistent store and replays its journal.
     *
     * @param data_dir Directory holding `journal.aev`.
     * @param logger Diagnostic sink; a default console logger is used when null.
     */
    DocumentStore(std::string data_dir, std::shared_ptr<infra::Logger> logger);

    ~DocumentStore();

    DocumentStore(const DocumentStore&) = delete;
    DocumentStore& operator=(const DocumentStore&) = delete;

    // ========================================================================
    //  SINGLE-OPERATION CRUD (each call is its own transaction)
    // ========================================================================

    /// @brief Returns the first match, or an empty handle.
    Document find_one(const std::string& collection, const cJSON* filter) const;

    /// @brief Returns all matches in insertion order (`limit` 0 = unlimited).
    std::vector<Document> find(const std::string& collection, const cJSON* filter,
                               std::size_t limit = 0) const;

    /// @brief Number of matching documents.
    std::size_t count(const std::string& collection, const cJSON* filter = nullptr) const;

    InsertResult insert_one(const std::string& collection, const cJSON* doc);
    UpdateResult replace_one(const std::string& collection, const cJSON* filter,
                             const cJSON* replacement);
    UpdateResult update_many(const std::string& collection, const cJSON* filter,
                             const cJSON* update);
    DeleteResult delete_many(const std::string& collection, const cJSON* filter);

    // ========================================================================
    //  TRANSACTIONS
    // ========================================================================

    /**
     * @brief Runs `callback` so that either all of its writes apply or none do.
     *
     * The callback receives a fresh `Session` per attempt. When the commit detects that a
     * collection the attempt read has since changed, the attempt is discarded and the
     * callback runs again, observing the newer state. Callbacks must therefore be safe to
     * re-execute.
     *
     * @param callback Invocable as `R(Session&)`.
     * @param options Consistency levels and retry deadline.
     * @return R The callback's result from the attempt that committed.
     *
     * @throws TransactionError When retries exceed `options.retry_timeout` or the journal
     * rejects the commit.
     * @throws Any exception thrown by the callback (the attempt is discarded).
     */
    template <typename Callback>
    auto run_in_transaction(Callback&& callback, const TransactionOptions& options = {})
        -> std::invoke_result_t<Callback&, Session&>;

    // ========================================================================
    //  ADMINISTRATIVE OPERATIONS
    // ========================================================================

    /**
     * @brief Creates a secondary hash index on a (dotted) field and backfills it.
     *
     * Equality filters with a single member on an indexed field skip the full scan.
     *
     * @return true If the index exists after the call.
     */
    bool create_index(const std::string& collection, const std::string& field);

    /**
     * @brief Rewrites the journal from live state, purging superseded frames.
     *
     * @return true If compaction completed; false for ephemeral stores or on I/O errors.
     */
    bool compact();

    /// @brief Whether commits are journaled to disk.
    bool persistent() const
    {
        return journal_ != nullptr;
    }

    /// @brief Commits fsync()ed under `WriteConcern::MAJORITY` since the store was opened.
    std::uint64_t synced_commits() const;

    /// @brief The diagnostic sink shared with layered components.
    const std::shared_ptr<infra::Logger>& logger() const
    {
        return logger_;
    }

  private:
    friend class Session;

    struct Collection {
        Document docs = Document::array();
        std::unordered_map<std::string, cJSON*> by_id;

        /// @brief Field -> index key -> documents.
        std::unordered_map<std::string, std::unordered_map<std::string, std::vector<cJSON*>>>
            indexes;

        std::uint64_t generation = 0;
    };

    // --- Internal Logic ---

    std::vector<Document> scan(const std::string& collection, const cJSON* filter,
                               std::size_t limit, const Session::Overlay* overlay,
                               std::unordered_map<std::string, std::uint64_t>& observed) const;
    bool commit(Session& session);

    Collection& collection(const std::string& name);
    void apply_put(Collection& coll, Document doc);
    void apply_erase(Collection& coll, const std::string& id);
    void index_document(Collection& coll, cJSON* doc, bool add);
    void apply_frame(const std::string& payload);

    void load_all();
    bool compact_locked();
    std::vector<std::string> snapshot_frames() const;

    std::shared_ptr<infra::Logger> logger_;
    std::unique_ptr<Engine> journal_;

    mutable std::shared_mutex rw_lock_;
    std::unordered_map<std::string, Collection> collections_;

    /// @brief Frames currently in the journal (drives the compaction heuristic).
    std::size_t journal_frames_ = 0;
};

template <typename Callback>
auto DocumentStore::run_in_transaction(Callback&& callback, const TransactionOptions& options)
    -> std::invoke_result_t<Callback&, Session&>
{
    using Result = std::invoke_result_t<Callback&, Session&>;
    const auto deadline = std::chrono::steady_clock::now() + options.retry_timeout;

    for (int attempt = 1;; ++attempt) {
        Session session(*this, options);
        if constexpr (std::is_void_v<Result>) {
            callback(session);
            if (commit(session))
                return;
        } else {
            Result result = callback(session);
            if (commit(session))
                return result;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            throw TransactionError("Transaction aborted: write conflict persisted after " +
                                   std::to_string(attempt) + " attempt(s)");
        }
        logger_->log(infra::LogLevel::DEBUG, "Txn: Write conflict detected, retrying (attempt " +
                                                 std::to_string(attempt + 1) + ")");
        std::this_thread::yield();
    }
}

} // namespace chronicle::storage
