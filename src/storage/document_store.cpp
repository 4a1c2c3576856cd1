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
 * @file document_store.cpp
 * @brief Implementation of the transactional document store.
 *
 * @details
 * Committed state lives in per-collection cJSON arrays guarded by one reader-writer lock.
 * Transactions never hold that lock while user code runs: reads take it shared for the
 * duration of one scan, and the commit takes it exclusively to validate, journal and
 * apply the staged writes in one step.
 */

#include "chronicle/storage/document_store.hpp"

#include "chronicle/storage/query.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace chronicle::storage {

namespace {

/// @brief Documents per frame when the journal is rewritten from live state.
constexpr std::size_t kCompactionBatch = 512;

/// @brief Journals below this size are never auto-compacted at startup.
constexpr std::size_t kCompactionMinDocs = 100;

} // namespace

DocumentStore::DocumentStore(std::shared_ptr<infra::Logger> logger)
    : logger_(logger ? std::move(logger) : std::make_shared<infra::Logger>())
{
    logger_->log(infra::LogLevel::DEBUG, "Core: Ephemeral document store online.");
}

/**
 * @brief Opens the data directory and restores in-memory state.
 *
 * **Startup Sequence:**
 * 1. Creates the data directory when absent.
 * 2. Replays the journal (`load_all`).
 * 3. Rewrites the journal when its tail was damaged or it is dominated by superseded frames.
 */
DocumentStore::DocumentStore(std::string data_dir, std::shared_ptr<infra::Logger> logger)
    : logger_(logger ? std::move(logger) : std::make_shared<infra::Logger>()),
      journal_(std::make_unique<Engine>(std::move(data_dir)))
{
    logger_->log(infra::LogLevel::INFO, "Core: Opening journal " + journal_->path());
    journal_->init();
    load_all();
}

DocumentStore::~DocumentStore() = default;

// ============================================================================
//  PERSISTENCE
// ============================================================================

void DocumentStore::load_all()
{
    std::unique_lock<std::shared_mutex> lock(rw_lock_);

    bool corrupt = false;
    std::vector<std::string> frames = journal_->load(corrupt);
    logger_->log(infra::LogLevel::DEBUG,
                 "Core: Replaying " + std::to_string(frames.size()) + " journal frame(s)...");

    for (const auto& frame : frames) {
        apply_frame(frame);
    }
    journal_frames_ = frames.size();

    std::size_t docs = 0;
    for (const auto& entry : collections_) {
        docs += entry.second.by_id.size();
    }

    if (corrupt) {
        logger_->log(infra::LogLevel::ERROR,
                     "Core: Damaged journal tail discarded after frame " +
                         std::to_string(frames.size()) + "; rewriting journal.");
        if (!compact_locked())
            throw std::runtime_error("Unable to rewrite damaged journal " + journal_->path());
    } else if (journal_frames_ > docs * 2 && docs > kCompactionMinDocs) {
        logger_->log(infra::LogLevel::INFO, "Maintenance: Auto-compacting journal.");
        compact_locked();
    }

    logger_->log(infra::LogLevel::INFO, "Core: Restored " + std::to_string(docs) +
                                            " document(s) in " +
                                            std::to_string(collections_.size()) +
                                            " collection(s).");
}

/**
 * @brief Replays one commit record.
 *
 * A frame that passed its checksum but does not hold a commit record is skipped; the
 * remaining frames are still applied.
 */
void DocumentStore::apply_frame(const std::string& payload)
{
    Document record = Document::parse(payload);
    const cJSON* ops = record["ops"];
    if (!cJSON_IsArray(ops)) {
        logger_->log(infra::LogLevel::ERROR, "Core: Skipping malformed journal frame.");
        return;
    }

    const cJSON* op = nullptr;
    cJSON_ArrayForEach(op, ops)
    {
        const cJSON* kind = cJSON_GetObjectItemCaseSensitive(op, "op");
        const cJSON* name = cJSON_GetObjectItemCaseSensitive(op, "collection");
        if (!cJSON_IsString(kind) || !cJSON_IsString(name))
            continue;

        Collection& coll = collection(name->valuestring);
        std::string action = kind->valuestring;
        if (action == "put") {
            const cJSON* doc = cJSON_GetObjectItemCaseSensitive(op, "doc");
            if (cJSON_IsObject(doc) && !id_of(doc).empty())
                apply_put(coll, Document::copy_of(doc));
        } else if (action == "erase") {
            const cJSON* id = cJSON_GetObjectItemCaseSensitive(op, "_id");
            if (cJSON_IsString(id))
                apply_erase(coll, id->valuestring);
        }
    }
}

std::vector<std::string> DocumentStore::snapshot_frames() const
{
    std::vector<std::string> frames;

    for (const auto& entry : collections_) {
        Document record;
        cJSON* ops = nullptr;
        std::size_t batched = 0;

        const cJSON* doc = nullptr;
        cJSON_ArrayForEach(doc, entry.second.docs.get())
        {
            if (!record) {
                record = Document::object();
                ops = cJSON_AddArrayToObject(record.get(), "ops");
            }
            cJSON* op = cJSON_CreateObject();
            cJSON_AddStringToObject(op, "op", "put");
            cJSON_AddStringToObject(op, "collection", entry.first.c_str());
            cJSON_AddItemToObject(op, "doc", cJSON_Duplicate(doc, 1));
            cJSON_AddItemToArray(ops, op);

            if (++batched == kCompactionBatch) {
                frames.push_back(record.dump());
                record = Document();
                batched = 0;
            }
        }
        if (record)
            frames.push_back(record.dump());
    }
    return frames;
}

bool DocumentStore::compact_locked()
{
    std::vector<std::string> frames = snapshot_frames();
    if (!journal_->compact(frames)) {
        logger_->log(infra::LogLevel::ERROR, "Maintenance: Journal compaction failed.");
        return false;
    }
    logger_->log(infra::LogLevel::DEBUG, "Maintenance: Journal compacted from " +
                                             std::to_string(journal_frames_) + " to " +
                                             std::to_string(frames.size()) + " frame(s).");
    journal_frames_ = frames.size();
    return true;
}

std::uint64_t DocumentStore::synced_commits() const
{
    return journal_ ? journal_->synced_frames() : 0;
}

bool DocumentStore::compact()
{
    if (!journal_)
        return false;
    std::unique_lock<std::shared_mutex> lock(rw_lock_);
    return compact_locked();
}

// ============================================================================
//  MEMORY AND INDEX MANAGEMENT
// ============================================================================

DocumentStore::Collection& DocumentStore::collection(const std::string& name)
{
    return collections_[name];
}

void DocumentStore::index_document(Collection& coll, cJSON* doc, bool add)
{
    for (auto& index : coll.indexes) {
        std::string key = Query::index_key(Query::resolve(doc, index.first));
        if (key.empty())
            continue;

        auto& bucket = index.second[key];
        if (add) {
            bucket.push_back(doc);
        } else {
            bucket.erase(std::remove(bucket.begin(), bucket.end(), doc), bucket.end());
            if (bucket.empty())
                index.second.erase(key);
        }
    }
}

/**
 * @brief Inserts or replaces a committed document (upsert by `_id`).
 */
void DocumentStore::apply_put(Collection& coll, Document doc)
{
    std::string id = id_of(doc.get());
    cJSON* raw = doc.release();

    auto it = coll.by_id.find(id);
    if (it != coll.by_id.end()) {
        index_document(coll, it->second, false);
        cJSON_ReplaceItemViaPointer(coll.docs.get(), it->second, raw);
        it->second = raw;
    } else {
        cJSON_AddItemToArray(coll.docs.get(), raw);
        coll.by_id.emplace(id, raw);
    }
    index_document(coll, raw, true);
}

void DocumentStore::apply_erase(Collection& coll, const std::string& id)
{
    auto it = coll.by_id.find(id);
    if (it == coll.by_id.end())
        return;

    index_document(coll, it->second, false);
    cJSON_Delete(cJSON_DetachItemViaPointer(coll.docs.get(), it->second));
    coll.by_id.erase(it);
}

bool DocumentStore::create_index(const std::string& collection_name, const std::string& field)
{
    if (field.empty())
        throw std::invalid_argument("Index field must not be empty");

    std::unique_lock<std::shared_mutex> lock(rw_lock_);
    Collection& coll = collection(collection_name);
    if (coll.indexes.count(field))
        return true;

    auto& index = coll.indexes[field];
    cJSON* doc = nullptr;
    cJSON_ArrayForEach(doc, coll.docs.get())
    {
        std::string key = Query::index_key(Query::resolve(doc, field));
        if (!key.empty())
            index[key].push_back(doc);
    }
    logger_->log(infra::LogLevel::DEBUG, "Index: Created on " + collection_name + "." + field);
    return true;
}

// ============================================================================
//  READ PATH
// ============================================================================

/**
 * @brief Evaluates a filter over committed state merged with an overlay.
 *
 * **Execution Strategy:**
 * 1. **Tier 1:** `{"_id": "<id>"}` resolves through the primary hash index.
 * 2. **Tier 2:** a single equality on an indexed field resolves through its bucket.
 * 3. **Fallback:** full scan in insertion order.
 *
 * Committed documents shadowed by the overlay are skipped; staged documents are matched
 * in a second pass. The collection generation observed here is recorded on first read.
 */
std::vector<Document> DocumentStore::scan(
    const std::string& collection_name, const cJSON* filter, std::size_t limit,
    const Session::Overlay* overlay,
    std::unordered_map<std::string, std::uint64_t>& observed) const
{
    std::vector<Document> results;
    auto full = [&]() { return limit != 0 && results.size() >= limit; };

    std::shared_lock<std::shared_mutex> lock(rw_lock_);

    auto it = collections_.find(collection_name);
    observed.emplace(collection_name, it == collections_.end() ? 0 : it->second.generation);

    if (it != collections_.end()) {
        const Collection& coll = it->second;
        auto visit = [&](const cJSON* doc) {
            if (overlay && overlay->docs.count(id_of(doc)))
                return;
            if (Query::matches(doc, filter))
                results.push_back(Document::copy_of(doc));
        };

        std::string field;
        const cJSON* value = Query::simple_equality(filter, field);
        bool routed = false;

        if (value && field == "_id") {
            routed = true;
            if (cJSON_IsString(value)) {
                auto hit = coll.by_id.find(value->valuestring);
                if (hit != coll.by_id.end())
                    visit(hit->second);
            }
        } else if (value) {
            auto index = coll.indexes.find(field);
            if (index != coll.indexes.end()) {
                routed = true;
                auto bucket = index->second.find(Query::index_key(value));
                if (bucket != index->second.end()) {
                    for (const cJSON* doc : bucket->second) {
                        visit(doc);
                        if (full())
                            return results;
                    }
                }
            }
        }

        if (!routed) {
            const cJSON* doc = nullptr;
            cJSON_ArrayForEach(doc, coll.docs.get())
            {
                visit(doc);
                if (full())
                    return results;
            }
        }
    }

    if (overlay) {
        for (const auto& id : overlay->order) {
            if (full())
                break;
            const Document& staged = overlay->docs.at(id);
            if (staged && Query::matches(staged.get(), filter))
                results.push_back(Document::copy_of(staged.get()));
        }
    }

    if (limit != 0 && results.size() > limit)
        results.resize(limit);
    return results;
}

Document DocumentStore::find_one(const std::string& collection, const cJSON* filter) const
{
    std::vector<Document> hits = find(collection, filter, 1);
    if (hits.empty())
        return Document();
    return std::move(hits.front());
}

std::vector<Document> DocumentStore::find(const std::string& collection, const cJSON* filter,
                                          std::size_t limit) const
{
    std::unordered_map<std::string, std::uint64_t> observed;
    return scan(collection, filter, limit, nullptr, observed);
}

std::size_t DocumentStore::count(const std::string& collection, const cJSON* filter) const
{
    return find(collection, filter).size();
}

// ============================================================================
//  WRITE PATH
// ============================================================================

InsertResult DocumentStore::insert_one(const std::string& collection, const cJSON* doc)
{
    return run_in_transaction(
        [&](Session& session) { return session.insert_one(collection, doc); });
}

UpdateResult DocumentStore::replace_one(const std::string& collection, const cJSON* filter,
                                        const cJSON* replacement)
{
    return run_in_transaction(
        [&](Session& session) { return session.replace_one(collection, filter, replacement); });
}

UpdateResult DocumentStore::update_many(const std::string& collection, const cJSON* filter,
                                        const cJSON* update)
{
    return run_in_transaction(
        [&](Session& session) { return session.update_many(collection, filter, update); });
}

DeleteResult DocumentStore::delete_many(const std::string& collection, const cJSON* filter)
{
    return run_in_transaction(
        [&](Session& session) { return session.delete_many(collection, filter); });
}

/**
 * @brief Validates and applies one transaction attempt.
 *
 * **Commit Protocol:**
 * 1. **Validation:** every collection the attempt read must still be at the generation
 * it observed; otherwise the attempt is rejected (returns false) and nothing changes.
 * 2. **Durability:** the staged writes are serialized into one journal frame.
 * 3. **Apply:** the writes are applied to memory and indexes, and the generation of
 * each written collection is bumped.
 *
 * @throws TransactionError If the journal append fails.
 */
bool DocumentStore::commit(Session& session)
{
    if (session.overlays_.empty())
        return true;

    std::unique_lock<std::shared_mutex> lock(rw_lock_);

    for (const auto& seen : session.observed_) {
        auto it = collections_.find(seen.first);
        std::uint64_t current = it == collections_.end() ? 0 : it->second.generation;
        if (current != seen.second) {
            logger_->log(infra::LogLevel::TRACE, "Txn: Conflict on collection " + seen.first);
            return false;
        }
    }

    Document record = Document::object();
    cJSON* ops = cJSON_AddArrayToObject(record.get(), "ops");
    for (const auto& entry : session.overlays_) {
        auto committed = collections_.find(entry.first);
        for (const auto& id : entry.second.order) {
            const Document& staged = entry.second.docs.at(id);
            cJSON* op = cJSON_CreateObject();
            if (staged) {
                cJSON_AddStringToObject(op, "op", "put");
                cJSON_AddStringToObject(op, "collection", entry.first.c_str());
                cJSON_AddItemToObject(op, "doc", cJSON_Duplicate(staged.get(), 1));
            } else if (committed != collections_.end() && committed->second.by_id.count(id)) {
                cJSON_AddStringToObject(op, "op", "erase");
                cJSON_AddStringToObject(op, "collection", entry.first.c_str());
                cJSON_AddStringToObject(op, "_id", id.c_str());
            } else {
                // Inserted and deleted within the same transaction.
                cJSON_Delete(op);
                continue;
            }
            cJSON_AddItemToArray(ops, op);
        }
    }

    if (cJSON_GetArraySize(ops) == 0)
        return true;

    if (journal_) {
        auto started = std::chrono::steady_clock::now();
        bool sync = session.options_.write_concern == WriteConcern::MAJORITY;
        if (!journal_->append(record.dump(), sync))
            throw TransactionError("Journal append failed; transaction aborted");
        ++journal_frames_;

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        if (elapsed > session.options_.write_timeout) {
            logger_->log(infra::LogLevel::WARN, "Txn: Journal write took " +
                                                    std::to_string(elapsed.count()) +
                                                    "ms, above the write timeout");
        }
    }

    for (auto& entry : session.overlays_) {
        Collection& coll = collection(entry.first);
        for (const auto& id : entry.second.order) {
            Document& staged = entry.second.docs.at(id);
            if (staged)
                apply_put(coll, std::move(staged));
            else
                apply_erase(coll, id);
        }
        ++coll.generation;
    }
    session.overlays_.clear();
    return true;
}

} // namespace chronicle::storage
