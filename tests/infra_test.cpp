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
 * @file infra_test.cpp
 * @brief Unit tests for shared infrastructure primitives (IdGenerator, String, Logger).
 */

#include "chronicle/infra/clock.hpp"
#include "chronicle/infra/id_generator.hpp"
#include "chronicle/infra/logger.hpp"
#include "chronicle/infra/string.hpp"
#include "framework.hpp"
#include "helpers.hpp"

#include <chrono>
#include <set>
#include <stdexcept>
#include <string>

using chronicle::infra::IdGenerator;
using chronicle::infra::LogLevel;
using chronicle::infra::String;

/**
 * @brief Identities are 24 lowercase hex characters.
 */
void test_id_format()
{
    std::string id = IdGenerator::generate();
    ASSERT_EQ(id.length(), IdGenerator::kLength);
    ASSERT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
}

/**
 * @brief A burst of identities from one process never collides.
 */
void test_id_uniqueness()
{
    std::set<std::string> seen;
    for (int i = 0; i < 10000; ++i) {
        seen.insert(IdGenerator::generate());
    }
    ASSERT_EQ(seen.size(), static_cast<std::size_t>(10000));
}

void test_id_embeds_creation_time()
{
    auto before = std::chrono::duration_cast<std::chrono::seconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
    std::uint32_t stamped = IdGenerator::timestamp_of(IdGenerator::generate());

    ASSERT_TRUE(stamped >= static_cast<std::uint32_t>(before));
    ASSERT_TRUE(stamped <= static_cast<std::uint32_t>(before) + 5);
    ASSERT_EQ(IdGenerator::timestamp_of("not-an-id"), 0u);
}

void test_string_trim()
{
    ASSERT_EQ(String::trim("   hello chronicle   "), std::string("hello chronicle"));
    ASSERT_EQ(String::trim("  \t\n  \r "), std::string(""));
}

void test_string_starts_with()
{
    ASSERT_TRUE(String::starts_with("--log-level", "--"));
    ASSERT_FALSE(String::starts_with("-", "--"));
}

void test_system_clock_is_milliseconds()
{
    auto clock = chronicle::infra::system_clock();
    chronicle::infra::Timestamp now = clock();
    // 2020-01-01T00:00:00Z in milliseconds.
    ASSERT_TRUE(now > 1577836800000LL);
}

/**
 * @brief Threshold filtering and stream segregation.
 */
void test_logger_routing()
{
    chronicle::test::LogCapture capture(LogLevel::INFO);

    capture.logger->log(LogLevel::DEBUG, "hidden detail");
    capture.logger->log(LogLevel::INFO, "engine online");
    capture.logger->log(LogLevel::WARN, "dangling link");

    ASSERT_EQ(capture.out.str().find("hidden detail"), std::string::npos);
    ASSERT_NE(capture.out.str().find("[INFO] engine online"), std::string::npos);
    ASSERT_NE(capture.err.str().find("[WARN] dangling link"), std::string::npos);
    ASSERT_EQ(capture.out.str().find("dangling link"), std::string::npos);

    capture.logger->set_threshold(LogLevel::TRACE);
    ASSERT_TRUE(capture.logger->enabled(LogLevel::TRACE));
}

void test_logger_parse_level()
{
    ASSERT_TRUE(chronicle::infra::Logger::parse_level("DEBUG") == LogLevel::DEBUG);
    ASSERT_TRUE(chronicle::infra::Logger::parse_level("warn") == LogLevel::WARN);
    ASSERT_THROWS(chronicle::infra::Logger::parse_level("loud"), std::invalid_argument);
}
