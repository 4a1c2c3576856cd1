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
 * @file handler_test.cpp
 * @brief Integration tests for the command handler.
 *
 * @details
 * Verifies the critical path between the shell protocol and the versioning engine:
 * JSON in, engine call, JSON out. Each test runs against its own store so results are
 * independent of execution order.
 */

#include "chronicle/command/handler.hpp"
#include "chronicle/storage/document_store.hpp"
#include "framework.hpp"
#include "helpers.hpp"

#include <cJSON.h>
#include <string>

using chronicle::command::Handler;
using chronicle::storage::Document;
using chronicle::storage::DocumentStore;
using chronicle::test::json;
using chronicle::test::same_json;

namespace {

/// @brief Handler over an ephemeral store with a fixed clock.
struct Shell {
    Shell() : store(capture.logger), handler(store, options(), capture.logger) {}

    chronicle::history::Options options() const
    {
        chronicle::history::Options defaults;
        defaults.clock = clock.clock();
        return defaults;
    }

    /// @brief Sends one request and parses the response.
    Document send(const std::string& request)
    {
        return json(handler.process(request));
    }

    chronicle::test::LogCapture capture;
    chronicle::test::ManualClock clock;
    DocumentStore store;
    Handler handler;
};

std::string status_of(const Document& resp)
{
    const cJSON* status = cJSON_GetObjectItem(resp.get(), "status");
    return cJSON_IsString(status) ? status->valuestring : "";
}

std::string message_of(const Document& resp)
{
    const cJSON* message = cJSON_GetObjectItem(resp.get(), "message");
    return cJSON_IsString(message) ? message->valuestring : "";
}

} // namespace

/**
 * @brief Declare, write twice, then read the first state back by version and by date.
 */
void test_handle_patch_and_revisions()
{
    Shell shell;

    Document declared =
        shell.send(R"({"action": "declare", "collection": "people", "primary_key": ["id"]})");
    ASSERT_EQ(status_of(declared), std::string("ok"));

    Document created = shell.send(
        R"({"action": "patch_one", "collection": "people", "data": {"id": 1, "name": "Ada"}})");
    ASSERT_EQ(status_of(created), std::string("ok"));
    ASSERT_EQ(message_of(created), std::string("Record created"));
    ASSERT_TRUE(same_json(cJSON_GetObjectItem(created["data"], "version"),
                          R"({"major": 1, "minor": 0})"));

    shell.clock.advance(100);
    Document patched = shell.send(
        R"({"action": "patch_one", "collection": "people", "data": {"id": 1, "name": "Ada L."},
            "metadata": {"user": "ops"}})");
    ASSERT_EQ(message_of(patched), std::string("Record patched"));

    Document unchanged = shell.send(
        R"({"action": "patch_one", "collection": "people", "data": {"id": 1, "name": "Ada L."}})");
    ASSERT_EQ(message_of(unchanged), std::string("No changes"));
    ASSERT_TRUE(cJSON_IsNull(unchanged["data"]));

    Document by_version = shell.send(R"({"action": "revision_by_version", "collection": "people",
                                         "key": {"id": 1}, "major": 1, "minor": 0})");
    ASSERT_TRUE(same_json(cJSON_GetObjectItem(by_version["data"], "name"), R"("Ada")"));

    Document by_date = shell.send(
        R"({"action": "revision_by_date", "collection": "people", "key": {"id": 1}, "at": 1050})");
    ASSERT_TRUE(same_json(cJSON_GetObjectItem(by_date["data"], "name"), R"("Ada")"));

    Document revisions =
        shell.send(R"({"action": "revisions", "collection": "people", "key": {"id": 1}})");
    ASSERT_EQ(cJSON_GetArraySize(revisions["data"]), 2);

    Document found = shell.send(
        R"({"action": "find", "collection": "people", "query": {"name": "Ada L."}, "limit": 5})");
    ASSERT_EQ(cJSON_GetArraySize(found["data"]), 1);
}

void test_handle_patch_many_and_delete()
{
    Shell shell;
    shell.send(R"({"action": "declare", "collection": "people", "primary_key": ["id"]})");
    shell.send(R"({"action": "patch_many", "collection": "people",
                   "data": [{"id": 1}, {"id": 2}, {"id": 3}]})");

    Document resp = shell.send(R"({"action": "patch_many", "collection": "people",
                                   "data": [{"id": 1, "v": 2}], "missing_mark_deleted": true,
                                   "filter": {"id": {"$gte": 2}}})");
    ASSERT_EQ(status_of(resp), std::string("ok"));
    ASSERT_EQ(cJSON_GetArraySize(cJSON_GetObjectItem(resp["data"], "outcomes")), 1);
    ASSERT_TRUE(same_json(cJSON_GetObjectItem(resp["data"], "marked_deleted"), "2"));

    Document erased =
        shell.send(R"({"action": "delete", "collection": "people", "key": {"id": 1}})");
    ASSERT_TRUE(same_json(erased["data"], R"({"records": 1, "deltas": 2})"));
    ASSERT_EQ(shell.store.count("people"), static_cast<std::size_t>(2));
}

/**
 * @brief Malformed requests are answered with an error status, never an exception.
 */
void test_handle_invalid_requests()
{
    Shell shell;

    Document bad_json = shell.send("{ action : \"patch_one\", collection : ... ");
    ASSERT_EQ(status_of(bad_json), std::string("error"));
    ASSERT_EQ(message_of(bad_json), std::string("Invalid JSON syntax"));

    ASSERT_EQ(message_of(shell.send("")), std::string("Empty request payload"));
    ASSERT_EQ(message_of(shell.send(R"({"action": "fly"})")),
              std::string("Unknown action opcode: fly"));

    Document unknown =
        shell.send(R"({"action": "patch_one", "collection": "ghosts", "data": {"id": 1}})");
    ASSERT_EQ(status_of(unknown), std::string("error"));
    ASSERT_NE(message_of(unknown).find("Unknown record type"), std::string::npos);

    shell.send(R"({"action": "declare", "collection": "people", "primary_key": ["id"]})");
    Document keyless =
        shell.send(R"({"action": "patch_one", "collection": "people", "data": {"name": "x"}})");
    ASSERT_EQ(status_of(keyless), std::string("error"));
    ASSERT_NE(message_of(keyless).find("Key error"), std::string::npos);

    Document no_data = shell.send(R"({"action": "patch_one", "collection": "people"})");
    ASSERT_EQ(status_of(no_data), std::string("error"));

    Document bad_filter = shell.send(
        R"({"action": "find", "collection": "people", "query": {"id": {"$regex": "1"}}})");
    ASSERT_EQ(status_of(bad_filter), std::string("error"));

    Document bad_type =
        shell.send(R"({"action": "declare", "collection": "_hidden", "primary_key": ["id"]})");
    ASSERT_NE(message_of(bad_type).find("Configuration error"), std::string::npos);

    ASSERT_EQ(status_of(shell.send(R"({"action": "exit"})")), std::string("goodbye"));
}

/**
 * @brief Numbers and paths beyond any integer range are answered, not fatal.
 */
void test_handle_out_of_range_arguments()
{
    Shell shell;
    shell.send(R"({"action": "declare", "collection": "people", "primary_key": ["id"]})");
    shell.send(R"({"action": "patch_one", "collection": "people", "data": {"id": 1, "tags": [1, 2]}})");

    Document found = shell.send(
        R"({"action": "find", "collection": "people", "query": {"tags.99999999999": 1}})");
    ASSERT_EQ(status_of(found), std::string("ok"));
    ASSERT_EQ(cJSON_GetArraySize(found["data"]), 0);

    Document marked = shell.send(R"({"action": "patch_many", "collection": "people",
                                     "data": [{"id": 2}], "missing_mark_deleted": true,
                                     "filter": {"tags.99999999999999999999": 1}})");
    ASSERT_EQ(status_of(marked), std::string("ok"));

    Document huge = shell.send(R"({"action": "revision_by_version", "collection": "people",
                                   "key": {"id": 1}, "major": 1e300, "minor": 0})");
    ASSERT_EQ(status_of(huge), std::string("error"));
    ASSERT_NE(message_of(huge).find("out of range"), std::string::npos);

    Document late = shell.send(R"({"action": "revision_by_date", "collection": "people",
                                   "key": {"id": 1}, "at": -1e300})");
    ASSERT_EQ(status_of(late), std::string("error"));

    Document limited = shell.send(
        R"({"action": "find", "collection": "people", "query": {}, "limit": 1e300})");
    ASSERT_EQ(status_of(limited), std::string("ok"));
    ASSERT_EQ(cJSON_GetArraySize(limited["data"]), 2);
}

void test_handle_redeclare()
{
    Shell shell;
    shell.send(R"({"action": "declare", "collection": "people", "primary_key": ["id"]})");

    Document same =
        shell.send(R"({"action": "declare", "collection": "people", "primary_key": ["id"]})");
    ASSERT_EQ(status_of(same), std::string("ok"));
    ASSERT_EQ(message_of(same), std::string("Record type already declared"));

    Document other =
        shell.send(R"({"action": "declare", "collection": "people", "primary_key": ["uid"]})");
    ASSERT_EQ(status_of(other), std::string("error"));
    ASSERT_NE(message_of(other).find("declared with key (id)"), std::string::npos);
}

/**
 * @brief Declarations and history survive a restart.
 */
void test_handle_declarations_persist()
{
    chronicle::test::TempDir dir("chronicle_handler_persist");
    chronicle::test::LogCapture capture;

    {
        DocumentStore store(dir.path, capture.logger);
        Handler handler(store, chronicle::history::Options(), capture.logger);
        handler.process(R"({"action": "declare", "collection": "people", "primary_key": ["id"]})");
        handler.process(R"({"action": "patch_one", "collection": "people", "data": {"id": 1, "v": 1}})");
        handler.process(R"({"action": "patch_one", "collection": "people", "data": {"id": 1, "v": 2}})");
    }

    DocumentStore store(dir.path, capture.logger);
    Handler handler(store, chronicle::history::Options(), capture.logger);
    ASSERT_EQ(handler.record_types().size(), static_cast<std::size_t>(1));
    ASSERT_EQ(handler.record_types()[0], std::string("people"));

    Document first = json(handler.process(R"({"action": "revision_by_version", "collection": "people",
                                              "key": {"id": 1}, "major": 1, "minor": 0})"));
    ASSERT_TRUE(same_json(cJSON_GetObjectItem(first["data"], "v"), "1"));

    Document compacted = json(handler.process(R"({"action": "compact"})"));
    ASSERT_EQ(status_of(compacted), std::string("ok"));
}
