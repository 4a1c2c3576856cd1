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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * Stateless helpers used by the query module (dotted field paths), the versioning
 * engine (error messages listing key fields) and the command shell (input sanitizing).
 */

#pragma once

#include <string>
#include <vector>

namespace chronicle::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace (as classified by `std::isspace`).
     *
     * @code
     * chronicle::infra::String::trim("  {\"action\":\"exit\"}\n"); // "{\"action\":\"exit\"}"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Splits a string on a delimiter, keeping empty segments.
     *
     * Used to turn dotted field paths (`meta.version.major`) into path segments.
     * An empty input yields a single empty segment.
     */
    static std::vector<std::string> split(const std::string& s, char delimiter);

    /**
     * @brief Joins segments with a separator.
     *
     * @code
     * String::join({"tenant", "id"}, ", "); // "tenant, id"
     * @endcode
     */
    static std::string join(const std::vector<std::string>& parts, const std::string& separator);

    /// @brief Returns true when `s` begins with `prefix`.
    static bool starts_with(const std::string& s, const std::string& prefix);
};

} // namespace chronicle::infra
