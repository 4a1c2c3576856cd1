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
 * @file query.hpp
 * @brief Filter evaluation and update operators for the document store.
 *
 * @details
 * This header declares the `Query` class, the predicate and mutation engine used by
 * every read and bulk write of the store. Filters and updates are JSON documents in
 * the familiar operator dialect:
 *
 * ```json
 * {"$and": [{"tenant": "acme"}, {"meta.deleted": null}], "id": {"$nin": [1, 2]}}
 * {"$set": {"meta.deleted": {"timestamp": 1700000000000, "metadata": null}}}
 * ```
 *
 * Field names may be dotted paths that descend into embedded objects.
 */

#pragma once

#include <cJSON.h>
#include <string>

namespace chronicle::storage {

/**
 * @class Query
 * @brief Stateless evaluator for filter and update documents.
 *
 * @details
 * **Supported filter grammar:**
 * - Implicit equality: `{"path": value}`. Deep structural comparison; `null` also matches
 *   a missing field.
 * - Field operators: `$eq`, `$ne`, `$in`, `$nin`, `$exists`, `$gt`, `$gte`, `$lt`,
 *   `$lte`, `$not`.
 * - Logical combinators (top level or nested): `$and`, `$or`, `$nor`.
 *
 * **Supported update operators:** `$set`, `$unset`.
 *
 * Malformed documents (unknown operators, wrong operand types) raise
 * `std::invalid_argument`.
 */
class Query {
  public:
    /**
     * @brief Evaluates a filter against a document.
     *
     * @param doc The candidate document.
     * @param filter The filter; `nullptr` or `{}` matches everything.
     * @return true If `doc` satisfies every clause of `filter`.
     */
    static bool matches(const cJSON* doc, const cJSON* filter);

    /**
     * @brief Applies an update document in place.
     *
     * @param doc The document to mutate (must be an object).
     * @param update An object whose members are update operators.
     * @return true If `doc` changed.
     */
    static bool apply_update(cJSON* doc, const cJSON* update);

    /**
     * @brief Resolves a dotted path inside a document.
     *
     * @return const cJSON* The addressed value, or `nullptr` if any segment is missing.
     */
    static const cJSON* resolve(const cJSON* doc, const std::string& path);

    /**
     * @brief Extracts the single equality value of a simple filter.
     *
     * A filter is simple when it holds exactly one member that is not an operator and
     * whose value is a string or number (e.g. `{"_id": "..."}`). Used by the store to
     * route lookups through hash indexes.
     *
     * @param filter The filter to inspect.
     * @param field Receives the member name when simple.
     * @return const cJSON* The equality operand, or `nullptr` when not simple.
     */
    static const cJSON* simple_equality(const cJSON* filter, std::string& field);

    /**
     * @brief Normalizes a scalar to an index key (`s:<text>` or `n:<number>`).
     *
     * @return std::string Empty for non-scalar values.
     */
    static std::string index_key(const cJSON* value);
};

} // namespace chronicle::storage
