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
 * @file helpers.hpp
 * @brief Fixtures shared by the test translation units.
 */

#pragma once

#include "chronicle/infra/clock.hpp"
#include "chronicle/infra/logger.hpp"
#include "chronicle/storage/document.hpp"

#include <atomic>
#include <cJSON.h>
#include <filesystem>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace chronicle::test {

/**
 * @brief Parses a JSON literal, failing loudly on typos in the test itself.
 */
inline storage::Document json(const std::string& text)
{
    storage::Document doc = storage::Document::parse(text);
    if (!doc)
        throw std::invalid_argument("Bad JSON literal in test: " + text);
    return doc;
}

/**
 * @brief Compares a value against a JSON literal, ignoring member order.
 */
inline bool same_json(const cJSON* value, const std::string& expected)
{
    storage::Document want = json(expected);
    return value != nullptr && cJSON_Compare(value, want.get(), 1);
}

/**
 * @brief Copy of `doc` without `_id` and the given metadata key.
 */
inline storage::Document content(const cJSON* doc, const std::string& keyname)
{
    storage::Document out = storage::Document::copy_of(doc);
    cJSON_DeleteItemFromObjectCaseSensitive(out.get(), "_id");
    cJSON_DeleteItemFromObjectCaseSensitive(out.get(), keyname.c_str());
    return out;
}

/**
 * @class ManualClock
 * @brief Deterministic time source; copies share the same current time.
 */
class ManualClock {
  public:
    explicit ManualClock(infra::Timestamp start = 1000)
        : now_(std::make_shared<std::atomic<infra::Timestamp>>(start))
    {
    }

    infra::Clock clock() const
    {
        auto now = now_;
        return [now]() { return now->load(); };
    }

    infra::Timestamp now() const
    {
        return now_->load();
    }

    void advance(infra::Timestamp ms)
    {
        now_->fetch_add(ms);
    }

  private:
    std::shared_ptr<std::atomic<infra::Timestamp>> now_;
};

/**
 * @class LogCapture
 * @brief Logger writing to in-memory streams.
 *
 * @warning Declare it before any component holding `logger`.
 */
class LogCapture {
  public:
    explicit LogCapture(infra::LogLevel threshold = infra::LogLevel::WARN)
        : logger(std::make_shared<infra::Logger>(out, err, threshold, false))
    {
    }

    /// @brief Whether any emitted line contains `text`.
    bool contains(const std::string& text) const
    {
        return out.str().find(text) != std::string::npos ||
               err.str().find(text) != std::string::npos;
    }

    std::ostringstream out;
    std::ostringstream err;
    std::shared_ptr<infra::Logger> logger;
};

/**
 * @class TempDir
 * @brief RAII scratch directory: purged on construction and destruction.
 */
class TempDir {
  public:
    explicit TempDir(std::string name) : path((std::filesystem::temp_directory_path() / name).string())
    {
        std::filesystem::remove_all(path);
    }

    ~TempDir()
    {
        std::error_code ignored;
        std::filesystem::remove_all(path, ignored);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string path;
};

} // namespace chronicle::test
