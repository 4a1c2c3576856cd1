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
 * @file transaction.hpp
 * @brief Consistency options, operation results and error types of the document store.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace chronicle::storage {

/**
 * @enum ReadConcern
 * @brief Visibility guarantee for reads inside a transaction.
 *
 * The store runs on a single node, so every committed write is also majority-committed;
 * both levels read the latest committed state merged with the session's own writes.
 */
enum class ReadConcern {
    LOCAL,   ///< Latest committed state.
    MAJORITY ///< State acknowledged by a majority (identical to LOCAL on one node).
};

/**
 * @enum WriteConcern
 * @brief Durability requirement before a commit is acknowledged.
 */
enum class WriteConcern {
    ACKNOWLEDGED, ///< The journal frame has been handed to the operating system.
    MAJORITY      ///< The journal frame has been fsync()ed to stable storage.
};

/**
 * @struct TransactionOptions
 * @brief Consistency and retry settings for `DocumentStore::run_in_transaction`.
 */
struct TransactionOptions {
    ReadConcern read_concern = ReadConcern::LOCAL;
    WriteConcern write_concern = WriteConcern::MAJORITY;

    /// @brief Commits whose durable flush exceeds this bound are reported at WARN.
    std::chrono::milliseconds write_timeout{1000};

    /// @brief Conflicting attempts are retried until this much time has elapsed.
    std::chrono::milliseconds retry_timeout{120000};
};

/// @brief Result of `insert_one`.
struct InsertResult {
    std::string inserted_id;
};

/// @brief Result of `replace_one` and `update_many`.
struct UpdateResult {
    std::size_t matched_count = 0;
    std::size_t modified_count = 0;
};

/// @brief Result of `delete_many`.
struct DeleteResult {
    std::size_t deleted_count = 0;
};

/**
 * @class TransactionError
 * @brief A transaction could not be committed.
 *
 * Raised when conflicting attempts exhaust `retry_timeout` or when the journal rejects
 * a commit. Nothing of the failed transaction is visible afterwards.
 */
class TransactionError : public std::runtime_error {
  public:
    explicit TransactionError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class DuplicateKeyError
 * @brief An insert supplied an `_id` that already exists in the collection.
 */
class DuplicateKeyError : public std::runtime_error {
  public:
    DuplicateKeyError(const std::string& collection, const std::string& id)
        : std::runtime_error("Duplicate _id '" + id + "' in collection '" + collection + "'")
    {
    }
};

} // namespace chronicle::storage
