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
 * @file storage_test.cpp
 * @brief Unit tests for storage durability, transactions and CRUD orchestration.
 *
 * @details
 * Validates that the document store:
 * 1. Journals one frame per commit and restores state by replay.
 * 2. Discards a damaged tail frame as a whole.
 * 3. Makes transactions all-or-nothing and retries conflicting attempts.
 */

#include "chronicle/storage/document_store.hpp"
#include "chronicle/storage/engine.hpp"
#include "framework.hpp"
#include "helpers.hpp"

#include <cJSON.h>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <sys/resource.h>

namespace fs = std::filesystem;

using chronicle::storage::DocumentStore;
using chronicle::storage::Document;
using chronicle::storage::Session;
using chronicle::test::json;

/**
 * @brief Inserts generate identities, lookups see them, duplicates are rejected.
 */
void test_store_insert_and_find()
{
    chronicle::test::LogCapture capture;
    DocumentStore store(capture.logger);

    auto generated = store.insert_one("items", json(R"({"name": "a", "n": 1})").get());
    ASSERT_EQ(generated.inserted_id.size(), static_cast<std::size_t>(24));
    store.insert_one("items", json(R"({"_id": "fixed", "name": "b", "n": 2})").get());

    ASSERT_EQ(store.count("items"), static_cast<std::size_t>(2));
    Document found = store.find_one("items", json(R"({"_id": "fixed"})").get());
    ASSERT_TRUE(found);
    ASSERT_TRUE(chronicle::test::same_json(found["name"], R"("b")"));

    ASSERT_THROWS(store.insert_one("items", json(R"({"_id": "fixed"})").get()),
                  chronicle::storage::DuplicateKeyError);
    ASSERT_THROWS(store.insert_one("items", json(R"({"_id": 5})").get()), std::invalid_argument);
    ASSERT_EQ(store.find("items", json(R"({"n": {"$gte": 1}})").get(), 1).size(),
              static_cast<std::size_t>(1));
}

void test_store_replace_update_delete()
{
    chronicle::test::LogCapture capture;
    DocumentStore store(capture.logger);
    store.insert_one("items", json(R"({"_id": "x", "v": 1, "tag": "t"})").get());
    store.insert_one("items", json(R"({"_id": "y", "v": 2, "tag": "t"})").get());

    auto replaced = store.replace_one("items", json(R"({"_id": "x"})").get(),
                                      json(R"({"v": 10})").get());
    ASSERT_EQ(replaced.matched_count, static_cast<std::size_t>(1));
    ASSERT_EQ(replaced.modified_count, static_cast<std::size_t>(1));
    ASSERT_TRUE(chronicle::test::same_json(store.find_one("items", json(R"({"_id": "x"})").get()).get(),
                                           R"({"_id": "x", "v": 10})"));
    ASSERT_THROWS(store.replace_one("items", json(R"({"_id": "x"})").get(),
                                    json(R"({"_id": "z"})").get()),
                  std::invalid_argument);

    auto updated = store.update_many("items", json(R"({"tag": "t"})").get(),
                                     json(R"({"$set": {"seen": true}})").get());
    ASSERT_EQ(updated.matched_count, static_cast<std::size_t>(1));
    ASSERT_EQ(updated.modified_count, static_cast<std::size_t>(1));

    auto deleted = store.delete_many("items", json(R"({"v": {"$in": [2, 10]}})").get());
    ASSERT_EQ(deleted.deleted_count, static_cast<std::size_t>(2));
    ASSERT_EQ(store.count("items"), static_cast<std::size_t>(0));
}

/**
 * @brief Reads inside a transaction observe the transaction's own writes.
 */
void test_store_read_your_writes()
{
    chronicle::test::LogCapture capture;
    DocumentStore store(capture.logger);
    store.insert_one("items", json(R"({"_id": "keep", "v": 1})").get());

    std::size_t seen = store.run_in_transaction([&](Session& session) {
        session.insert_one("items", json(R"({"_id": "new", "v": 2})").get());
        session.delete_many("items", json(R"({"_id": "keep"})").get());
        ASSERT_FALSE(store.find_one("items", json(R"({"_id": "new"})").get()));
        return session.find("items", nullptr).size();
    });

    ASSERT_EQ(seen, static_cast<std::size_t>(1));
    ASSERT_TRUE(store.find_one("items", json(R"({"_id": "new"})").get()));
    ASSERT_FALSE(store.find_one("items", json(R"({"_id": "keep"})").get()));
}

/**
 * @brief A throwing callback leaves no trace.
 */
void test_store_transaction_rollback()
{
    chronicle::test::LogCapture capture;
    DocumentStore store(capture.logger);

    ASSERT_THROWS(store.run_in_transaction([&](Session& session) {
        session.insert_one("items", json(R"({"_id": "a"})").get());
        session.insert_one("items", json(R"({"_id": "a"})").get());
    }),
                  chronicle::storage::DuplicateKeyError);
    ASSERT_EQ(store.count("items"), static_cast<std::size_t>(0));
}

/**
 * @brief A conflicting commit between read and commit forces a re-run.
 */
void test_store_conflict_retry()
{
    chronicle::test::LogCapture capture;
    DocumentStore store(capture.logger);
    store.insert_one("counters", json(R"({"_id": "c", "v": 0})").get());

    int attempts = 0;
    store.run_in_transaction([&](Session& session) {
        ++attempts;
        Document current = session.find_one("counters", json(R"({"_id": "c"})").get());
        int v = current["v"]->valueint;
        if (attempts == 1) {
            // Concurrent writer commits after our read.
            store.update_many("counters", nullptr, json(R"({"$set": {"v": 100}})").get());
        }
        Document next = json(R"({"v": 0})");
        cJSON_SetNumberValue(cJSON_GetObjectItem(next.get(), "v"), v + 1);
        session.replace_one("counters", json(R"({"_id": "c"})").get(), next.get());
    });

    ASSERT_EQ(attempts, 2);
    Document final_state = store.find_one("counters", json(R"({"_id": "c"})").get());
    ASSERT_EQ(final_state["v"]->valueint, 101);
}

void test_store_retry_deadline_exceeded()
{
    chronicle::test::LogCapture capture;
    DocumentStore store(capture.logger);
    store.insert_one("items", json(R"({"_id": "a", "v": 0})").get());

    chronicle::storage::TransactionOptions options;
    options.retry_timeout = std::chrono::milliseconds(0);

    ASSERT_THROWS(store.run_in_transaction(
                      [&](Session& session) {
                          session.find_one("items", json(R"({"_id": "a"})").get());
                          store.insert_one("items", json(R"({"v": 1})").get());
                          session.insert_one("items", json(R"({"v": 2})").get());
                      },
                      options),
                  chronicle::storage::TransactionError);
}

/**
 * @brief Warm start: state is rebuilt from the journal.
 */
void test_store_persistence()
{
    chronicle::test::TempDir dir("chronicle_store_persistence");
    chronicle::test::LogCapture capture;

    {
        DocumentStore store(dir.path, capture.logger);
        store.insert_one("items", json(R"({"_id": "a", "v": 1})").get());
        store.insert_one("items", json(R"({"_id": "b", "v": 2})").get());
        store.update_many("items", json(R"({"_id": "a"})").get(),
                          json(R"({"$set": {"v": 3}})").get());
        store.delete_many("items", json(R"({"_id": "b"})").get());
    }
    ASSERT_TRUE(fs::file_size(dir.path + "/journal.aev") > 0);

    DocumentStore reopened(dir.path, capture.logger);
    ASSERT_EQ(reopened.count("items"), static_cast<std::size_t>(1));
    ASSERT_TRUE(chronicle::test::same_json(
        reopened.find_one("items", json(R"({"_id": "a"})").get()).get(), R"({"_id": "a", "v": 3})"));

    ASSERT_TRUE(reopened.compact());
    DocumentStore compacted(dir.path, capture.logger);
    ASSERT_EQ(compacted.count("items"), static_cast<std::size_t>(1));
}

/**
 * @brief Bytes of a torn append are discarded; earlier commits survive and the journal
 * stays appendable.
 */
void test_store_damaged_tail()
{
    chronicle::test::TempDir dir("chronicle_store_damaged");
    chronicle::test::LogCapture capture;

    {
        DocumentStore store(dir.path, capture.logger);
        store.insert_one("items", json(R"({"_id": "a"})").get());
        store.insert_one("items", json(R"({"_id": "b"})").get());
    }
    auto size = fs::file_size(dir.path + "/journal.aev");
    fs::resize_file(dir.path + "/journal.aev", size - 3);

    {
        DocumentStore store(dir.path, capture.logger);
        ASSERT_EQ(store.count("items"), static_cast<std::size_t>(1));
        ASSERT_TRUE(capture.contains("Damaged journal tail"));
        store.insert_one("items", json(R"({"_id": "c"})").get());
    }

    DocumentStore store(dir.path, capture.logger);
    ASSERT_TRUE(store.find_one("items", json(R"({"_id": "c"})").get()));
    ASSERT_EQ(store.count("items"), static_cast<std::size_t>(2));
}

void test_engine_checksum_detects_flip()
{
    chronicle::test::TempDir dir("chronicle_engine_flip");
    chronicle::storage::Engine engine(dir.path);
    engine.init();
    ASSERT_TRUE(engine.append(R"({"ops":[]})", true));
    ASSERT_TRUE(engine.append(R"({"ops":[1]})", true));

    {
        std::fstream file(engine.path(), std::ios::in | std::ios::out | std::ios::binary);
        file.seekp(-2, std::ios::end);
        file.put('X');
    }

    bool corrupt = false;
    auto frames = engine.load(corrupt);
    ASSERT_TRUE(corrupt);
    ASSERT_EQ(frames.size(), static_cast<std::size_t>(1));
}

/**
 * @brief Only MAJORITY commits are fsync()ed; ACKNOWLEDGED ones are written without it.
 */
void test_store_write_concern_sync()
{
    chronicle::test::TempDir dir("chronicle_store_sync");
    chronicle::test::LogCapture capture;
    DocumentStore store(dir.path, capture.logger);
    ASSERT_EQ(store.synced_commits(), static_cast<std::uint64_t>(0));

    chronicle::storage::TransactionOptions relaxed;
    relaxed.write_concern = chronicle::storage::WriteConcern::ACKNOWLEDGED;
    store.run_in_transaction(
        [](Session& session) { session.insert_one("items", json(R"({"_id": "a"})").get()); },
        relaxed);
    ASSERT_EQ(store.synced_commits(), static_cast<std::uint64_t>(0));

    store.run_in_transaction(
        [](Session& session) { session.insert_one("items", json(R"({"_id": "b"})").get()); });
    ASSERT_EQ(store.synced_commits(), static_cast<std::uint64_t>(1));

    DocumentStore reopened(dir.path, capture.logger);
    ASSERT_EQ(reopened.count("items"), static_cast<std::size_t>(2));

    DocumentStore ephemeral(capture.logger);
    ephemeral.insert_one("items", json(R"({"_id": "a"})").get());
    ASSERT_EQ(ephemeral.synced_commits(), static_cast<std::uint64_t>(0));
}

/**
 * @brief A short write is rolled back, and stray bytes behind the last intact frame
 * are cut before the next frame lands.
 */
void test_engine_failed_append_leaves_no_trace()
{
    chronicle::test::TempDir dir("chronicle_engine_short_write");
    chronicle::storage::Engine engine(dir.path);
    engine.init();
    ASSERT_TRUE(engine.append(R"({"ops":[1]})", false));
    auto before = fs::file_size(engine.path());

    // Cap the file size a few bytes past the current end so the frame is cut short.
    struct rlimit saved {};
    ASSERT_EQ(::getrlimit(RLIMIT_FSIZE, &saved), 0);
    struct rlimit capped = saved;
    capped.rlim_cur = static_cast<rlim_t>(before + 6);
    auto previous = std::signal(SIGXFSZ, SIG_IGN);
    bool capped_ok = ::setrlimit(RLIMIT_FSIZE, &capped) == 0;
    bool appended = engine.append(R"({"ops":[")" + std::string(64, 'x') + R"("]})", true);
    ASSERT_EQ(::setrlimit(RLIMIT_FSIZE, &saved), 0);
    std::signal(SIGXFSZ, previous);

    ASSERT_TRUE(capped_ok);
    ASSERT_FALSE(appended);
    ASSERT_EQ(fs::file_size(engine.path()), before);
    ASSERT_EQ(engine.synced_frames(), static_cast<std::uint64_t>(0));

    ASSERT_TRUE(engine.append(R"({"ops":[2]})", false));
    {
        std::ofstream tail(engine.path(), std::ios::binary | std::ios::app);
        tail.write("\x10\x00\x00\x00torn", 8);
    }
    ASSERT_TRUE(engine.append(R"({"ops":[3]})", true));
    ASSERT_EQ(engine.synced_frames(), static_cast<std::uint64_t>(1));

    chronicle::storage::Engine reopened(dir.path);
    bool corrupt = false;
    auto frames = reopened.load(corrupt);
    ASSERT_FALSE(corrupt);
    ASSERT_EQ(frames.size(), static_cast<std::size_t>(3));
    ASSERT_EQ(frames[2], std::string(R"({"ops":[3]})"));
}

void test_engine_rejects_oversized_frame()
{
    chronicle::test::TempDir dir("chronicle_engine_oversized");
    chronicle::storage::Engine engine(dir.path);
    engine.init();
    ASSERT_TRUE(engine.append(R"({"ops":[1]})", false));
    auto before = fs::file_size(engine.path());

    std::string huge(static_cast<std::size_t>(chronicle::storage::Engine::kMaxFrameSize) + 1, ' ');
    ASSERT_FALSE(engine.append(huge, false));
    ASSERT_EQ(fs::file_size(engine.path()), before);

    bool corrupt = false;
    ASSERT_EQ(engine.load(corrupt).size(), static_cast<std::size_t>(1));
    ASSERT_FALSE(corrupt);
}

/**
 * @brief Secondary indexes stay consistent across updates and deletes.
 */
void test_store_secondary_index()
{
    chronicle::test::LogCapture capture;
    DocumentStore store(capture.logger);
    store.insert_one("items", json(R"({"_id": "a", "meta": {"link": "p1"}})").get());
    ASSERT_TRUE(store.create_index("items", "meta.link"));
    store.insert_one("items", json(R"({"_id": "b", "meta": {"link": "p2"}})").get());

    ASSERT_EQ(store.find_one("items", json(R"({"meta.link": "p1"})").get().dump(),
              std::string(R"({"_id":"a","meta":{"link":"p1"}})"));

    store.update_many("items", json(R"({"_id": "a"})").get(),
                      json(R"({"$set": {"meta.link": "p3"}})").get());
    ASSERT_FALSE(store.find_one("items", json(R"({"meta.link": "p1"})").get()));
    ASSERT_TRUE(store.find_one("items", json(R"({"meta.link": "p3"})").get()));

    store.delete_many("items", json(R"({"_id": "b"})").get());
    ASSERT_FALSE(store.find_one("items", json(R"({"meta.link": "p2"})").get()));
}
