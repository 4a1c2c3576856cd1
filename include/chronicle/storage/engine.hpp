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
 * @file engine.hpp
 * @brief Low-level commit journal of the document store.
 *
 * @details
 * This header declares the `Engine` class, which owns the single append-only journal
 * file of a data directory. Every committed transaction is written as exactly one
 * frame, so a crash can never leave half of a transaction on disk: a torn trailing
 * frame fails its checksum and is discarded as a whole during replay.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chronicle::storage {

/**
 * @class Engine
 * @brief Manages physical durability using a checksummed, frame-per-commit journal.
 *
 * @details
 * **Frame layout (little endian):**
 * `[u32 payload length][u32 FNV-1a checksum of payload][payload bytes]`
 *
 * **Storage Characteristics:**
 * 1. **Sequential Write Throughput:** commits are O(1) appends.
 * 2. **Atomic Recovery:** replay stops at the first short or corrupt frame.
 * 3. **Compaction:** the journal can be rewritten from a snapshot of live state via a
 * temporary file and an atomic rename.
 * 4. **No Torn Middles:** the engine remembers where the last intact frame ends. A failed
 * append is cut back to that offset, so a later successful frame never lands behind a
 * partial one.
 */
class Engine {
  public:
    /**
     * @brief Configures the journal location.
     *
     * @param base_path Directory holding `journal.aev`.
     */
    explicit Engine(std::string base_path);

    /**
     * @brief Creates the data directory when absent.
     *
     * @throws std::filesystem::filesystem_error If the directory cannot be created.
     */
    void init();

    /**
     * @brief Reads every intact frame in commit order.
     *
     * @param corrupt Set to true when replay stopped at a damaged frame.
     * @return std::vector<std::string> Frame payloads (one JSON commit record each).
     */
    std::vector<std::string> load(bool& corrupt);

    /**
     * @brief Appends one commit frame.
     *
     * @param payload The serialized commit record (at most `kMaxFrameSize` bytes).
     * @param sync Whether to fsync() the journal before returning.
     * @return true If the whole frame was written (and synced when requested). On false
     * the journal is left exactly as it was before the call.
     */
    bool append(const std::string& payload, bool sync);

    /**
     * @brief Rewrites the journal from a set of frames (temp file + rename).
     *
     * @param frames Payloads that fully describe the live state.
     * @return true If the new journal replaced the old one.
     *
     * @warning This is an I/O intensive operation.
     */
    bool compact(const std::vector<std::string>& frames);

    /// @brief Returns the journal path (`<base>/journal.aev`).
    std::string path() const;

    /// @brief FNV-1a (32-bit) checksum used for frame validation.
    static std::uint32_t checksum(const std::string& payload);

    /// @brief Number of frames appended with `sync` set.
    std::uint64_t synced_frames() const
    {
        return synced_frames_.load();
    }

    /// @brief Upper bound on a single commit record; larger lengths indicate a damaged header.
    static constexpr std::uint32_t kMaxFrameSize = 256u * 1024u * 1024u;

  private:
    std::string base_path_;

    /// @brief Byte offset just past the last intact frame, once known.
    std::optional<std::uint64_t> end_;

    std::atomic<std::uint64_t> synced_frames_{0};
};

} // namespace chronicle::storage
