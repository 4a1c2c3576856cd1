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
 * @file bulk_test.cpp
 * @brief Unit tests for batch patching, soft deletion and history erasure.
 */

#include "chronicle/history/versioned_collection.hpp"
#include "framework.hpp"
#include "helpers.hpp"
#include "history_fixture.hpp"

#include <string>
#include <vector>

using namespace chronicle::history;
using chronicle::storage::Document;
using chronicle::test::HistoryFixture;
using chronicle::test::json;
using chronicle::test::same_json;

namespace {

std::vector<Document> batch(const std::vector<std::string>& records)
{
    std::vector<Document> out;
    for (const auto& text : records) {
        out.push_back(json(text));
    }
    return out;
}

std::optional<MetadataHeader> header_of(const HistoryFixture& f, const std::string& key)
{
    auto live = f.people.find_one(json(key).get());
    if (!live)
        return std::nullopt;
    return MetadataHeader::from_json((*live)[f.keyname().c_str()]);
}

} // namespace

/**
 * @brief Records absent from the batch are stamped deleted; content and history stay.
 */
void test_mark_deleted_spares_batch()
{
    HistoryFixture f;
    f.people.patch_many(batch({R"({"id": 1, "v": 1})", R"({"id": 2, "v": 1})",
                               R"({"id": 3, "v": 1})"}));
    ASSERT_EQ(f.delta_count(), static_cast<std::size_t>(3));

    f.clock.advance(50);
    PatchManyOptions options;
    options.missing_mark_deleted = true;
    options.metadata = json(R"({"run": 2})");
    PatchManyResult result =
        f.people.patch_many(batch({R"({"id": 1, "v": 2})", R"({"id": 2, "v": 1})"}), options);

    ASSERT_EQ(result.outcomes.size(), static_cast<std::size_t>(1));
    ASSERT_TRUE(result.outcomes[0].kind == PatchOutcome::Kind::PATCHED);
    ASSERT_EQ(result.marked_deleted, static_cast<std::size_t>(1));

    auto third = header_of(f, R"({"id": 3})");
    ASSERT_TRUE(third->deleted.has_value());
    ASSERT_EQ(third->deleted->timestamp, 1050);
    ASSERT_TRUE(same_json(third->deleted->metadata.get(), R"({"run": 2})"));
    ASSERT_TRUE(third->version == (Version{1, 0}));
    ASSERT_TRUE(same_json(cJSON_GetObjectItem(f.people.find_one(json(R"({"id": 3})").get())->get(), "v"),
                          "1"));
    ASSERT_EQ(f.delta_count(json(R"({"id": 3})").get()), static_cast<std::size_t>(1));
    ASSERT_FALSE(header_of(f, R"({"id": 2})")->deleted.has_value());

    PatchManyResult again =
        f.people.patch_many(batch({R"({"id": 1, "v": 2})", R"({"id": 2, "v": 1})"}), options);
    ASSERT_TRUE(again.outcomes.empty());
    ASSERT_EQ(again.marked_deleted, static_cast<std::size_t>(0));
}

/**
 * @brief A record is spared only when its whole key tuple appears in the batch.
 */
void test_mark_deleted_matches_whole_key_tuple()
{
    HistoryFixture f(5, {"a", "b"});
    f.people.patch_many(batch({R"({"a": 1, "b": 1})", R"({"a": 1, "b": 2})",
                               R"({"a": 2, "b": 1})"}));

    PatchManyOptions options;
    options.missing_mark_deleted = true;
    PatchManyResult result =
        f.people.patch_many(batch({R"({"a": 1, "b": 1})", R"({"a": 2, "b": 1})"}), options);

    ASSERT_EQ(result.marked_deleted, static_cast<std::size_t>(1));
    ASSERT_TRUE(header_of(f, R"({"a": 1, "b": 2})")->deleted.has_value());
    ASSERT_FALSE(header_of(f, R"({"a": 1, "b": 1})")->deleted.has_value());
    ASSERT_FALSE(header_of(f, R"({"a": 2, "b": 1})")->deleted.has_value());
}

void test_mark_deleted_caller_filter()
{
    HistoryFixture f;
    f.people.patch_many(batch({R"({"id": 1, "group": "x"})", R"({"id": 2, "group": "x"})",
                               R"({"id": 3, "group": "y"})"}));

    PatchManyOptions options;
    options.missing_mark_deleted = true;
    options.missing_mark_deleted_filter = json(R"({"group": "x"})");
    PatchManyResult result = f.people.patch_many(batch({R"({"id": 1, "group": "x"})"}), options);

    ASSERT_EQ(result.marked_deleted, static_cast<std::size_t>(1));
    ASSERT_TRUE(header_of(f, R"({"id": 2})")->deleted.has_value());
    ASSERT_FALSE(header_of(f, R"({"id": 3})")->deleted.has_value());
}

/**
 * @brief Documents written outside the engine are never soft-deleted.
 */
void test_mark_deleted_skips_unversioned()
{
    HistoryFixture f;
    f.store.insert_one("people", json(R"({"id": 9, "v": 1})").get());
    f.write(R"({"id": 1, "v": 1})");

    PatchManyOptions options;
    options.missing_mark_deleted = true;
    PatchManyResult result = f.people.patch_many(batch({R"({"id": 1, "v": 1})"}), options);

    ASSERT_EQ(result.marked_deleted, static_cast<std::size_t>(0));
    ASSERT_FALSE(header_of(f, R"({"id": 9})").has_value());
}

/**
 * @brief The next successful write of a deleted record clears the mark.
 */
void test_patch_revives_deleted_record()
{
    HistoryFixture f;
    f.write(R"({"id": 1, "v": 1})");
    f.write(R"({"id": 2, "v": 1})");

    PatchManyOptions options;
    options.missing_mark_deleted = true;
    f.people.patch_many(batch({R"({"id": 1, "v": 1})"}), options);
    ASSERT_TRUE(header_of(f, R"({"id": 2})")->deleted.has_value());

    auto outcome = f.write(R"({"id": 2, "v": 2})");
    ASSERT_TRUE(outcome->version == (Version{1, 1}));
    ASSERT_FALSE(header_of(f, R"({"id": 2})")->deleted.has_value());
}

void test_delete_doc_and_patches()
{
    HistoryFixture f;
    f.write(R"({"id": 1, "v": 1})");
    f.write(R"({"id": 1, "v": 2})");
    f.write(R"({"id": 1, "v": 3})");
    f.write(R"({"id": 2, "v": 1})");

    EraseResult erased = f.people.delete_doc_and_patches(json(R"({"id": 1, "v": 99})").get());
    ASSERT_EQ(erased.records, static_cast<std::size_t>(1));
    ASSERT_EQ(erased.deltas, static_cast<std::size_t>(3));

    ASSERT_EQ(f.store.count("people"), static_cast<std::size_t>(1));
    ASSERT_EQ(f.delta_count(), static_cast<std::size_t>(1));
    ASSERT_TRUE(f.people.revisions(json(R"({"id": 1})").get()).empty());
    ASSERT_FALSE(f.people.get_revision_by_date(json(R"({"id": 1})").get(), 5000).has_value());
    ASSERT_EQ(f.people.revisions(json(R"({"id": 2})").get()).size(), static_cast<std::size_t>(1));

    EraseResult nothing = f.people.delete_doc_and_patches(json(R"({"id": 1})").get());
    ASSERT_EQ(nothing.records, static_cast<std::size_t>(0));
    ASSERT_EQ(nothing.deltas, static_cast<std::size_t>(0));
    ASSERT_THROWS(f.people.delete_doc_and_patches(json(R"({"v": 1})").get()), KeyConsistencyError);
}
