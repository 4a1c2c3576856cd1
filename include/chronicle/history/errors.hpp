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
 * @file errors.hpp
 * @brief Exceptions raised by the versioning engine.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace chronicle::history {

/**
 * @class ConfigurationError
 * @brief Invalid record type declaration or engine options.
 *
 * Thrown from constructors only; a constructed `VersionedCollection` is always valid.
 */
class ConfigurationError : public std::invalid_argument {
  public:
    explicit ConfigurationError(const std::string& message) : std::invalid_argument(message) {}
};

/**
 * @class KeyConsistencyError
 * @brief A record is missing a primary key field, or two records disagree on one.
 *
 * @details
 * Raised before any transaction starts, so no partial write is ever left behind.
 */
class KeyConsistencyError : public std::runtime_error {
  public:
    /// @brief The record lacks `field` (or holds null there).
    explicit KeyConsistencyError(const std::string& field)
        : std::runtime_error("Primary key field '" + field + "' is missing"), field_(field),
          left_("<missing>")
    {
    }

    /// @brief The records hold `left` and `right` respectively under `field`.
    KeyConsistencyError(const std::string& field, const std::string& left,
                        const std::string& right)
        : std::runtime_error("Primary key field '" + field + "' differs: " + left + " != " +
                             right),
          field_(field), left_(left), right_(right)
    {
    }

    const std::string& field() const
    {
        return field_;
    }

    const std::string& left() const
    {
        return left_;
    }

    const std::string& right() const
    {
        return right_;
    }

  private:
    std::string field_;
    std::string left_;
    std::string right_;
};

} // namespace chronicle::history
