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
 * @file handler.cpp
 * @brief Implementation of the command processing pipeline.
 *
 * @details
 * Every request goes through the same lifecycle:
 * 1. **Ingest**: parse the raw JSON line.
 * 2. **Resolve**: find the declared record type named by `collection`.
 * 3. **Execute**: route the action to the versioning engine.
 * 4. **Respond**: format the result, or the exception, as a JSON response.
 */

#include "chronicle/command/handler.hpp"

#include "chronicle/history/errors.hpp"
#include "chronicle/infra/string.hpp"
#include "chronicle/storage/transaction.hpp"

#include <stdexcept>
#include <utility>

namespace chronicle::command {

using storage::Document;

namespace {

std::string string_member(const cJSON* req, const char* name)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(req, name);
    return (cJSON_IsString(item) && item->valuestring) ? item->valuestring : "";
}

const cJSON* object_member(const cJSON* req, const char* name)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(req, name);
    if (!cJSON_IsObject(item))
        throw std::invalid_argument(std::string("Missing argument: '") + name + "' object");
    return item;
}

bool bool_member(const cJSON* req, const char* name)
{
    return cJSON_IsTrue(cJSON_GetObjectItemCaseSensitive(req, name));
}

std::int64_t integer_member(const cJSON* req, const char* name)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(req, name);
    if (!cJSON_IsNumber(item))
        throw std::invalid_argument(std::string("Missing argument: '") + name + "' number");
    auto value = storage::integer_of(item);
    if (!value)
        throw std::invalid_argument(std::string("Argument '") + name + "' is out of range");
    return *value;
}

std::set<std::string> ignore_fields_of(const cJSON* req)
{
    std::set<std::string> fields;
    const cJSON* name = nullptr;
    cJSON_ArrayForEach(name, cJSON_GetObjectItemCaseSensitive(req, "ignore_fields"))
    {
        if (cJSON_IsString(name) && name->valuestring)
            fields.insert(name->valuestring);
    }
    return fields;
}

const cJSON* metadata_of(const cJSON* req)
{
    const cJSON* metadata = cJSON_GetObjectItemCaseSensitive(req, "metadata");
    return cJSON_IsNull(metadata) ? nullptr : metadata;
}

Document outcome_document(const history::PatchOutcome& outcome)
{
    Document out = Document::object();
    cJSON_AddStringToObject(out.get(), "kind", history::to_string(outcome.kind));
    cJSON_AddStringToObject(out.get(), "record_id", outcome.record_id.c_str());
    cJSON_AddStringToObject(out.get(), "delta_id", outcome.delta_id.c_str());
    cJSON_AddItemToObject(out.get(), "version", outcome.version.to_document().release());
    return out;
}

} // namespace

Handler::Handler(storage::DocumentStore& store, history::Options defaults,
                 std::shared_ptr<infra::Logger> logger)
    : store_(store), defaults_(std::move(defaults)),
      logger_(logger ? std::move(logger) : store.logger())
{
    if (defaults_.num_deltas_before_snapshot < 1)
        throw history::ConfigurationError("num_deltas_before_snapshot must be at least 1");
    if (defaults_.internal_metadata_keyname.empty())
        throw history::ConfigurationError("internal_metadata_keyname must not be empty");
    restore();
}

// ============================================================================
//  RECORD TYPE REGISTRY
// ============================================================================

/**
 * @brief Re-declares every record type persisted by a previous session.
 *
 * Declarations that no longer validate are reported and skipped.
 */
void Handler::restore()
{
    for (const Document& decl : store_.find(kRecordTypesCollection, nullptr)) {
        std::string name = string_member(decl.get(), "name");
        std::vector<std::string> primary_key;
        const cJSON* field = nullptr;
        cJSON_ArrayForEach(field, decl["primary_key"])
        {
            if (cJSON_IsString(field) && field->valuestring)
                primary_key.emplace_back(field->valuestring);
        }

        try {
            declare(name, std::move(primary_key));
        } catch (const history::ConfigurationError& e) {
            logger_->log(infra::LogLevel::ERROR,
                         "Shell: Skipping stored declaration '" + name + "': " + e.what());
        }
    }
    if (!types_.empty()) {
        logger_->log(infra::LogLevel::INFO,
                     "Shell: Restored " + std::to_string(types_.size()) + " record type(s).");
    }
}

history::VersionedCollection& Handler::declare(const std::string& name,
                                               std::vector<std::string> primary_key)
{
    auto collection = std::make_unique<history::VersionedCollection>(
        store_, history::RecordType{name, std::move(primary_key)}, defaults_, logger_);
    auto& slot = types_[name];
    slot = std::move(collection);
    return *slot;
}

history::VersionedCollection& Handler::require(const std::string& name)
{
    auto it = types_.find(name);
    if (it == types_.end())
        throw std::invalid_argument("Unknown record type: '" + name + "' (declare it first)");
    return *it->second;
}

std::vector<std::string> Handler::record_types() const
{
    std::vector<std::string> names;
    for (const auto& entry : types_) {
        names.push_back(entry.first);
    }
    return names;
}

// ============================================================================
//  ACTIONS
// ============================================================================

Handler::Reply Handler::handle_declare(const cJSON* req, const std::string& collection)
{
    std::vector<std::string> primary_key;
    const cJSON* field = nullptr;
    cJSON_ArrayForEach(field, cJSON_GetObjectItemCaseSensitive(req, "primary_key"))
    {
        if (!cJSON_IsString(field) || !field->valuestring)
            throw std::invalid_argument("'primary_key' must be an array of field names");
        primary_key.emplace_back(field->valuestring);
    }

    auto existing = types_.find(collection);
    if (existing != types_.end()) {
        if (existing->second->type().primary_key != primary_key)
            return {false,
                    "Record type '" + collection + "' is declared with key (" +
                        infra::String::join(existing->second->type().primary_key, ", ") + ")",
                    {}};
        return {true, "Record type already declared", {}};
    }

    Document decl = Document::object();
    cJSON_AddStringToObject(decl.get(), "_id", collection.c_str());
    cJSON_AddStringToObject(decl.get(), "name", collection.c_str());
    cJSON* fields = cJSON_AddArrayToObject(decl.get(), "primary_key");
    for (const auto& name : primary_key) {
        cJSON_AddItemToArray(fields, cJSON_CreateString(name.c_str()));
    }

    declare(collection, primary_key);
    store_.insert_one(kRecordTypesCollection, decl.get());
    logger_->log(infra::LogLevel::INFO, "Shell: Declared record type " + collection);
    return {true, "Record type declared", {}};
}

Handler::Reply Handler::handle_patch_one(const cJSON* req, history::VersionedCollection& type)
{
    const cJSON* data = object_member(req, "data");
    auto outcome =
        type.patch_one(data, bool_member(req, "force"), ignore_fields_of(req), metadata_of(req));
    if (!outcome)
        return {true, "No changes", {}};
    return {true, "Record " + std::string(history::to_string(outcome->kind)),
            outcome_document(*outcome)};
}

Handler::Reply Handler::handle_patch_many(const cJSON* req, history::VersionedCollection& type)
{
    const cJSON* data = cJSON_GetObjectItemCaseSensitive(req, "data");
    if (!cJSON_IsArray(data))
        throw std::invalid_argument("Missing argument: 'data' array");

    std::vector<Document> records;
    const cJSON* record = nullptr;
    cJSON_ArrayForEach(record, data)
    {
        if (!cJSON_IsObject(record))
            throw std::invalid_argument("'data' must only contain objects");
        records.push_back(Document::copy_of(record));
    }

    history::PatchManyOptions options;
    options.missing_mark_deleted = bool_member(req, "missing_mark_deleted");
    const cJSON* filter = cJSON_GetObjectItemCaseSensitive(req, "filter");
    if (cJSON_IsObject(filter))
        options.missing_mark_deleted_filter = Document::copy_of(filter);
    options.metadata = Document::copy_of(metadata_of(req));
    options.force = bool_member(req, "force");
    options.ignore_fields = ignore_fields_of(req);

    history::PatchManyResult result = type.patch_many(records, options);

    Document out = Document::object();
    cJSON* outcomes = cJSON_AddArrayToObject(out.get(), "outcomes");
    for (const auto& outcome : result.outcomes) {
        cJSON_AddItemToArray(outcomes, outcome_document(outcome).release());
    }
    cJSON_AddNumberToObject(out.get(), "marked_deleted",
                            static_cast<double>(result.marked_deleted));
    return {true,
            std::to_string(result.outcomes.size()) + " record(s) written, " +
                std::to_string(result.marked_deleted) + " marked deleted",
            std::move(out)};
}

Handler::Reply Handler::handle_revision_by_date(const cJSON* req,
                                                history::VersionedCollection& type)
{
    auto revision = type.get_revision_by_date(object_member(req, "key"), integer_member(req, "at"));
    if (!revision)
        return {true, "No revision at that time", {}};
    return {true, "", std::move(*revision)};
}

Handler::Reply Handler::handle_revision_by_version(const cJSON* req,
                                                   history::VersionedCollection& type)
{
    std::int64_t major = integer_member(req, "major");
    std::int64_t minor = integer_member(req, "minor");

    const cJSON* key = cJSON_GetObjectItemCaseSensitive(req, "key");
    auto revision = cJSON_IsObject(key) ? type.get_revision_by_version(key, major, minor)
                                        : type.get_revision_by_version(major, minor);
    if (!revision)
        return {true, "No revision with that version", {}};
    return {true, "", std::move(*revision)};
}

Handler::Reply Handler::handle_revisions(const cJSON* req, history::VersionedCollection& type)
{
    Document out = Document::array();
    for (const auto& info : type.revisions(object_member(req, "key"))) {
        cJSON_AddItemToArray(out.get(), info.to_document().release());
    }
    return {true, "", std::move(out)};
}

Handler::Reply Handler::handle_find(const cJSON* req, history::VersionedCollection& type)
{
    const cJSON* query = cJSON_GetObjectItemCaseSensitive(req, "query");
    const cJSON* limit = cJSON_GetObjectItemCaseSensitive(req, "limit");
    auto requested = storage::integer_of(limit);
    std::size_t max = requested && *requested > 0 ? static_cast<std::size_t>(*requested) : 0;

    Document out = Document::array();
    for (Document& doc : store_.find(type.type().name, query, max)) {
        cJSON_AddItemToArray(out.get(), doc.release());
    }
    return {true, "", std::move(out)};
}

Handler::Reply Handler::handle_delete(const cJSON* req, history::VersionedCollection& type)
{
    history::EraseResult erased = type.delete_doc_and_patches(object_member(req, "key"));

    Document out = Document::object();
    cJSON_AddNumberToObject(out.get(), "records", static_cast<double>(erased.records));
    cJSON_AddNumberToObject(out.get(), "deltas", static_cast<double>(erased.deltas));
    return {true, erased.records ? "Record and history erased" : "No record matched",
            std::move(out)};
}

// ============================================================================
//  PIPELINE
// ============================================================================

std::string Handler::render(const Reply& reply)
{
    Document resp = Document::object();
    cJSON_AddStringToObject(resp.get(), "status", reply.ok ? "ok" : "error");
    if (!reply.message.empty())
        cJSON_AddStringToObject(resp.get(), "message", reply.message.c_str());
    if (reply.ok) {
        cJSON_AddItemToObject(resp.get(), "data",
                              reply.data ? cJSON_Duplicate(reply.data.get(), 1)
                                         : cJSON_CreateNull());
    }
    return resp.dump();
}

/**
 * @brief Processes a raw request and generates a JSON response.
 *
 * Exceptions raised by the engine never escape: key and configuration errors, malformed
 * filters and exhausted transactions are all reported as `"status": "error"`.
 */
std::string Handler::process(const std::string& raw_json)
{
    if (raw_json.empty())
        return render({false, "Empty request payload", {}});

    Document req = Document::parse(raw_json);
    if (!cJSON_IsObject(req.get()))
        return render({false, "Invalid JSON syntax", {}});

    std::string action = string_member(req.get(), "action");
    std::string collection = string_member(req.get(), "collection");

    if (action == "exit")
        return "{\"status\":\"goodbye\",\"message\":\"Closing session\"}";

    Reply reply;
    try {
        if (action == "compact") {
            reply = store_.compact() ? Reply{true, "Compaction completed", {}}
                                     : Reply{false, "Compaction failed (ephemeral store?)", {}};
        } else if (action == "declare") {
            reply = handle_declare(req.get(), collection);
        } else if (action == "patch_one") {
            reply = handle_patch_one(req.get(), require(collection));
        } else if (action == "patch_many") {
            reply = handle_patch_many(req.get(), require(collection));
        } else if (action == "revision_by_date") {
            reply = handle_revision_by_date(req.get(), require(collection));
        } else if (action == "revision_by_version") {
            reply = handle_revision_by_version(req.get(), require(collection));
        } else if (action == "revisions") {
            reply = handle_revisions(req.get(), require(collection));
        } else if (action == "find") {
            reply = handle_find(req.get(), require(collection));
        } else if (action == "delete") {
            reply = handle_delete(req.get(), require(collection));
        } else {
            reply = {false, "Unknown action opcode: " + action, {}};
        }
    } catch (const history::KeyConsistencyError& e) {
        reply = {false, std::string("Key error: ") + e.what(), {}};
    } catch (const history::ConfigurationError& e) {
        reply = {false, std::string("Configuration error: ") + e.what(), {}};
    } catch (const storage::TransactionError& e) {
        logger_->log(infra::LogLevel::ERROR, std::string("Shell: ") + e.what());
        reply = {false, std::string("Transaction error: ") + e.what(), {}};
    } catch (const std::invalid_argument& e) {
        reply = {false, e.what(), {}};
    } catch (const std::runtime_error& e) {
        logger_->log(infra::LogLevel::ERROR, std::string("Shell: ") + e.what());
        reply = {false, e.what(), {}};
    } catch (const std::exception& e) {
        logger_->log(infra::LogLevel::ERROR, std::string("Shell: Internal error: ") + e.what());
        reply = {false, std::string("Internal error: ") + e.what(), {}};
    }

    if (!reply.ok)
        logger_->log(infra::LogLevel::DEBUG, "Shell: " + action + " failed: " + reply.message);
    return render(reply);
}

} // namespace chronicle::command
