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
 * @file handler.hpp
 * @brief JSON command dispatcher of the `chronicle` shell.
 *
 * @details
 * This header declares the `Handler` class, the application layer between the line-based
 * shell and the versioning engine. It deserializes one JSON request per call, routes it to
 * the `VersionedCollection` of the named record type, and serializes the result (or the
 * exception) into a standardized JSON response.
 */

#pragma once

#include "chronicle/history/versioned_collection.hpp"
#include "chronicle/infra/logger.hpp"
#include "chronicle/storage/document.hpp"
#include "chronicle/storage/document_store.hpp"

#include <cJSON.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace chronicle::command {

/// @brief Collection persisting record type declarations.
inline constexpr const char* kRecordTypesCollection = "_record_types";

/**
 * @class Handler
 * @brief Interprets requests and marshals responses.
 *
 * @details
 * **Response Formats:**
 * - **Success:** `{"status": "ok", "message": "...", "data": <result>}`
 * - **Error:** `{"status": "error", "message": "<error description>"}`
 * - **Exit:** `{"status": "goodbye", "message": "Closing session"}`
 *
 * @code
 * {"action": "declare", "collection": "people", "primary_key": ["id"]}
 * {"action": "patch_one", "collection": "people", "data": {"id": 1, "name": "Ada"}}
 * {"action": "revision_by_version", "collection": "people", "key": {"id": 1},
 *  "major": 1, "minor": 0}
 * @endcode
 */
class Handler {
  public:
    /**
     * @brief Binds the dispatcher to a store and restores declared record types.
     *
     * @param store Backing store (must outlive the handler).
     * @param defaults Engine options applied to every record type.
     * @param logger Diagnostic sink.
     *
     * @throws history::ConfigurationError If `defaults` are invalid.
     */
    Handler(storage::DocumentStore& store, history::Options defaults,
            std::shared_ptr<infra::Logger> logger);

    /**
     * @brief Processes one raw request.
     *
     * @param raw_json The request line.
     * @return std::string The serialized JSON response.
     */
    std::string process(const std::string& raw_json);

    /// @brief Names of the declared record types, sorted.
    std::vector<std::string> record_types() const;

  private:
    struct Reply {
        bool ok = false;
        std::string message;
        storage::Document data;
    };

    void restore();
    history::VersionedCollection& declare(const std::string& name,
                                          std::vector<std::string> primary_key);
    history::VersionedCollection& require(const std::string& name);

    Reply handle_declare(const cJSON* req, const std::string& collection);
    Reply handle_patch_one(const cJSON* req, history::VersionedCollection& type);
    Reply handle_patch_many(const cJSON* req, history::VersionedCollection& type);
    Reply handle_revision_by_date(const cJSON* req, history::VersionedCollection& type);
    Reply handle_revision_by_version(const cJSON* req, history::VersionedCollection& type);
    Reply handle_revisions(const cJSON* req, history::VersionedCollection& type);
    Reply handle_find(const cJSON* req, history::VersionedCollection& type);
    Reply handle_delete(const cJSON* req, history::VersionedCollection& type);

    static std::string render(const Reply& reply);

    storage::DocumentStore& store_;
    history::Options defaults_;
    std::shared_ptr<infra::Logger> logger_;
    std::map<std::string, std::unique_ptr<history::VersionedCollection>> types_;
};

} // namespace chronicle::command
