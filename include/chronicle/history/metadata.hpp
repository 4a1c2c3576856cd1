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
 * @file metadata.hpp
 * @brief The metadata header embedded in every live record.
 *
 * @details
 * A live record carries its versioning state under the internal metadata key:
 *
 * ```json
 * {
 *   "previous_delta": "6716a8f2c41d9e07ab000003",
 *   "version": {"major": 1, "minor": 2},
 *   "created": {"timestamp": 1700000000000, "metadata": {"user": "etl"}},
 *   "updated": {"timestamp": 1700000600000, "metadata": null},
 *   "deleted": null
 * }
 * ```
 *
 * The header is an immutable value. The only way to obtain the header of the next state
 * is `advance(prior, transition)`.
 */

#pragma once

#include "chronicle/infra/clock.hpp"
#include "chronicle/storage/document.hpp"

#include <cJSON.h>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace chronicle::history {

/**
 * @struct Version
 * @brief `(major, minor)` pair; `major` counts checkpoints, `minor` patches since the last one.
 */
struct Version {
    std::int64_t major = 0;
    std::int64_t minor = 0;

    bool operator==(const Version& other) const
    {
        return major == other.major && minor == other.minor;
    }

    bool operator!=(const Version& other) const
    {
        return !(*this == other);
    }

    /// @brief `{"major": M, "minor": m}`.
    storage::Document to_document() const;

    /// @brief Parses `{"major", "minor"}`; `std::nullopt` when either is not a number.
    static std::optional<Version> from_json(const cJSON* value);

    /// @brief Renders `M.m`.
    std::string str() const;
};

/**
 * @struct Stamp
 * @brief When a state was written and the caller metadata attached to the write.
 */
struct Stamp {
    infra::Timestamp timestamp = 0;

    /// @brief Caller-supplied metadata (empty handle = JSON null).
    storage::Document metadata;

    storage::Document to_document() const;
    static std::optional<Stamp> from_json(const cJSON* value);
};

/**
 * @struct MetadataHeader
 * @brief Versioning state of one live record.
 */
struct MetadataHeader {
    /// @brief Newest delta entry able to reconstruct the preceding state.
    std::string previous_delta;
    Version version;
    Stamp created;
    Stamp updated;

    /// @brief Set by the bulk mark-deleted path; cleared by the next successful patch.
    std::optional<Stamp> deleted;

    storage::Document to_document() const;

    /**
     * @brief Parses the header stored under the internal metadata key.
     *
     * @return std::nullopt When `value` is absent or is not a well-formed header.
     */
    static std::optional<MetadataHeader> from_json(const cJSON* value);
};

// ============================================================================
//  STATE TRANSITIONS
// ============================================================================

/// @brief First write of a primary key; `origin_id` is the origin snapshot.
struct Created {
    std::string origin_id;
    infra::Timestamp now = 0;
    storage::Document metadata;
};

/// @brief Ordinary write preserved by the reverse patch `delta_id`.
struct Patched {
    std::string delta_id;
    infra::Timestamp now = 0;
    storage::Document metadata;
};

/// @brief Checkpoint write; `snapshot_id` captures the new state in full.
struct Snapshotted {
    std::string snapshot_id;
    infra::Timestamp now = 0;
    storage::Document metadata;
};

using Transition = std::variant<Created, Patched, Snapshotted>;

/**
 * @brief Computes the header of the state produced by `transition`.
 *
 * | Transition    | version            | created        | updated | deleted |
 * |---------------|--------------------|----------------|---------|---------|
 * | `Created`     | `{1, 0}`           | `{now, meta}`  | same    | null    |
 * | `Patched`     | `{major, minor+1}` | kept           | `{now, meta}` | null |
 * | `Snapshotted` | `{major+1, 0}`     | kept           | `{now, meta}` | null |
 *
 * @param prior Header of the stored record (ignored for `Created`).
 * @throws std::logic_error When `Patched`/`Snapshotted` is applied without a prior header.
 */
MetadataHeader advance(const std::optional<MetadataHeader>& prior, const Transition& transition);

} // namespace chronicle::history
