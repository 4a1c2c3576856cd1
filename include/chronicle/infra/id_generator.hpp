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
 * @file id_generator.hpp
 * @brief Generator of document identities (`_id`) for live records and delta entries.
 *
 * @details
 * Identities are 12-byte values rendered as 24 lowercase hexadecimal characters:
 * a 4-byte big-endian seconds timestamp, a 5-byte per-process random value and a
 * 3-byte incrementing counter. The timestamp prefix makes identities roughly ordered
 * by creation time, which keeps journal dumps and delta listings readable.
 */

#pragma once

#include <cstdint>
#include <string>

namespace chronicle::infra {

/**
 * @class IdGenerator
 * @brief A static, thread-safe source of unique document identities.
 */
class IdGenerator {
  public:
    /// @brief Number of characters in every generated identity.
    static constexpr std::size_t kLength = 24;

    /**
     * @brief Generates a new identity.
     *
     * Layout: `tttttttt rrrrrrrrrr cccccc`
     * - `t`: seconds since the Unix epoch (8 hex digits).
     * - `r`: random process discriminator drawn once per process (10 hex digits).
     * - `c`: counter seeded randomly and advanced atomically per call (6 hex digits).
     *
     * @return std::string The generated identity (e.g., "6716a8f2c41d9e07ab000001").
     */
    static std::string generate();

    /**
     * @brief Extracts the creation second embedded in an identity.
     *
     * @param id An identity produced by `generate()`.
     * @return std::uint32_t Seconds since the Unix epoch, or 0 if `id` is malformed.
     */
    static std::uint32_t timestamp_of(const std::string& id);
};

} // namespace chronicle::infra
