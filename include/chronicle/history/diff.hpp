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
 * @file diff.hpp
 * @brief Field-level difference between an incoming and a stored record.
 */

#pragma once

#include "chronicle/history/delta.hpp"
#include "chronicle/storage/document.hpp"

#include <cJSON.h>
#include <set>
#include <string>
#include <vector>

namespace chronicle::history {

/**
 * @class DiffEngine
 * @brief Computes reverse deltas between two top-level field sets.
 *
 * @details
 * Throughout, `a` is the newer (incoming) record and `b` the older (stored) one, so every
 * result describes how to turn `a` back into `b`. Comparison is shallow on field names
 * and deep on values. `_id` and the configured ignored names never take part.
 */
class DiffEngine {
  public:
    /**
     * @param primary_key Ordered primary key fields both records must agree on.
     * @param ignored Field names excluded from the comparison (`_id` is always added).
     */
    DiffEngine(std::vector<std::string> primary_key, std::set<std::string> ignored);

    /// @brief Fields of `b` absent from `a`, with their values from `b`.
    storage::Document additions(const cJSON* a, const cJSON* b) const;

    /// @brief Names of fields of `a` absent from `b`.
    std::vector<std::string> removals(const cJSON* a, const cJSON* b) const;

    /// @brief Fields present in both with differing values, with their values from `b`.
    storage::Document updates(const cJSON* a, const cJSON* b) const;

    /**
     * @brief All three components as a reverse `DeltaSet`.
     *
     * @throws KeyConsistencyError If the records disagree on a primary key field.
     */
    DeltaSet compute(const cJSON* a, const cJSON* b) const;

    /**
     * @brief Verifies that both records carry every primary key field with equal values.
     *
     * @throws KeyConsistencyError Naming the first offending field.
     */
    void check_key(const cJSON* a, const cJSON* b) const;

  private:
    bool ignored(const char* name) const;

    std::vector<std::string> primary_key_;
    std::set<std::string> ignored_;
};

} // namespace chronicle::history
