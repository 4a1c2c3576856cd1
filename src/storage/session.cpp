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
 * @file session.cpp
 * @brief Implementation of transaction-scoped CRUD.
 *
 * @details
 * Reads are delegated to `DocumentStore::scan`, which merges committed state with this
 * session's overlay. Writes never touch committed state; they are staged here and handed
 * to `DocumentStore::commit` as a whole once the callback returns.
 */

#include "chronicle/storage/session.hpp"

#include "chronicle/infra/id_generator.hpp"
#include "chronicle/storage/document_store.hpp"
#include "chronicle/storage/query.hpp"

#include <stdexcept>
#include <utility>

namespace chronicle::storage {

Session::Session(DocumentStore& store, const TransactionOptions& options)
    : store_(store), options_(options)
{
}

const Session::Overlay* Session::overlay(const std::string& collection) const
{
    auto it = overlays_.find(collection);
    return it == overlays_.end() ? nullptr : &it->second;
}

void Session::stage(const std::string& collection, const std::string& id, Document doc)
{
    Overlay& layer = overlays_[collection];
    auto it = layer.docs.find(id);
    if (it == layer.docs.end()) {
        layer.order.push_back(id);
        layer.docs.emplace(id, std::move(doc));
    } else {
        it->second = std::move(doc);
    }
}

Document Session::find_one(const std::string& collection, const cJSON* filter)
{
    std::vector<Document> hits = find(collection, filter, 1);
    if (hits.empty())
        return Document();
    return std::move(hits.front());
}

std::vector<Document> Session::find(const std::string& collection, const cJSON* filter,
                                    std::size_t limit)
{
    return store_.scan(collection, filter, limit, overlay(collection), observed_);
}

/**
 * @brief Stages an insert after checking `_id` uniqueness against the merged view.
 *
 * The uniqueness check is itself a read, so a concurrent insert of the same `_id` bumps
 * the collection generation and forces this attempt to retry.
 */
InsertResult Session::insert_one(const std::string& collection, const cJSON* doc)
{
    if (!cJSON_IsObject(doc))
        throw std::invalid_argument("insert_one expects a JSON object");

    Document staged = Document::copy_of(doc);
    std::string id;

    const cJSON* given = cJSON_GetObjectItemCaseSensitive(staged.get(), "_id");
    if (given) {
        if (!cJSON_IsString(given) || !given->valuestring || !*given->valuestring)
            throw std::invalid_argument("_id must be a non-empty string");
        id = given->valuestring;
    } else {
        id = infra::IdGenerator::generate();
        cJSON_AddStringToObject(staged.get(), "_id", id.c_str());
    }

    Document lookup = Document::object();
    cJSON_AddStringToObject(lookup.get(), "_id", id.c_str());
    if (find_one(collection, lookup.get()))
        throw DuplicateKeyError(collection, id);

    stage(collection, id, std::move(staged));
    return InsertResult{id};
}

UpdateResult Session::replace_one(const std::string& collection, const cJSON* filter,
                                  const cJSON* replacement)
{
    if (!cJSON_IsObject(replacement))
        throw std::invalid_argument("replace_one expects a JSON object replacement");

    UpdateResult result;
    Document current = find_one(collection, filter);
    if (!current)
        return result;

    std::string id = id_of(current.get());
    Document staged = Document::copy_of(replacement);

    cJSON* given = cJSON_GetObjectItemCaseSensitive(staged.get(), "_id");
    if (given) {
        if (!cJSON_IsString(given) || id != given->valuestring)
            throw std::invalid_argument("replace_one cannot change _id of " + id);
    } else {
        cJSON_AddStringToObject(staged.get(), "_id", id.c_str());
    }

    result.matched_count = 1;
    if (!staged.equals(current)) {
        result.modified_count = 1;
        stage(collection, id, std::move(staged));
    }
    return result;
}

UpdateResult Session::update_many(const std::string& collection, const cJSON* filter,
                                  const cJSON* update)
{
    if (!cJSON_IsObject(update))
        throw std::invalid_argument("update_many expects an update document");

    UpdateResult result;
    for (Document& doc : find(collection, filter)) {
        ++result.matched_count;
        std::string id = id_of(doc.get());
        if (Query::apply_update(doc.get(), update)) {
            ++result.modified_count;
            stage(collection, id, std::move(doc));
        }
    }
    return result;
}

DeleteResult Session::delete_many(const std::string& collection, const cJSON* filter)
{
    DeleteResult result;
    for (const Document& doc : find(collection, filter)) {
        stage(collection, id_of(doc.get()), Document());
        ++result.deleted_count;
    }
    return result;
}

} // namespace chronicle::storage
