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
 * @file clock.hpp
 * @brief Time source used to stamp writes and delta entries.
 *
 * @details
 * All timestamps in the versioning engine are integral milliseconds since the Unix
 * epoch. They are stored as JSON numbers, which represent such values exactly.
 * Components take a `Clock` rather than reading the system clock directly so that
 * tests can drive time deterministically.
 */

#pragma once

#include <cstdint>
#include <functional>

namespace chronicle::infra {

/// @brief Milliseconds since the Unix epoch.
using Timestamp = std::int64_t;

/// @brief A callable returning the current time.
using Clock = std::function<Timestamp()>;

/// @brief Reads `std::chrono::system_clock`.
Timestamp system_now();

/// @brief Returns a `Clock` bound to `system_now`.
Clock system_clock();

} // namespace chronicle::infra
