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
 * @file id_generator.cpp
 * @brief Implementation of the time-prefixed identity generator.
 */

#include "chronicle/infra/id_generator.hpp"

#include <atomic>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

namespace chronicle::infra {

namespace {

/// @brief Draws 64 bits from a freshly seeded engine.
std::uint64_t random_word()
{
    std::random_device rd;
    std::mt19937_64 gen((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
    return gen();
}

/// @brief Process discriminator, drawn once (40 significant bits).
std::uint64_t process_value()
{
    static const std::uint64_t value = random_word() & 0xFFFFFFFFFFULL;
    return value;
}

/// @brief Shared counter; starts at a random point to reduce cross-process collisions.
std::atomic<std::uint32_t>& counter()
{
    static std::atomic<std::uint32_t> value(static_cast<std::uint32_t>(random_word()));
    return value;
}

} // namespace

/**
 * @brief Generates a time-prefixed identity.
 *
 * Implementation Strategy:
 * 1. **Chronometry**: Truncates the system clock to whole seconds (32 bits).
 * 2. **Discrimination**: Appends the per-process random value (40 bits).
 * 3. **Sequencing**: Appends the low 24 bits of an atomic counter, so identities
 * generated within the same second by the same process never collide.
 */
std::string IdGenerator::generate()
{
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();
    std::uint32_t sequence = counter().fetch_add(1, std::memory_order_relaxed) & 0xFFFFFF;

    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(8)
       << static_cast<std::uint32_t>(seconds & 0xFFFFFFFF) << std::setw(10) << process_value()
       << std::setw(6) << sequence;
    return ss.str();
}

std::uint32_t IdGenerator::timestamp_of(const std::string& id)
{
    if (id.size() != kLength)
        return 0;
    try {
        return static_cast<std::uint32_t>(std::stoul(id.substr(0, 8), nullptr, 16));
    } catch (const std::exception&) {
        return 0;
    }
}

} // namespace chronicle::infra
