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
 * @file main.cpp
 * @brief Application Entry Point (Bootstrap).
 *
 * @details
 * This file contains the `main` function which orchestrates the startup sequence:
 * 1. Argument Parsing.
 * 2. Subsystem Initialization (Logger, Storage, Command Handler).
 * 3. Request Loop: one JSON request per stdin line, one JSON response per stdout line.
 *
 * Diagnostics go to stderr so that stdout carries nothing but responses.
 */

#include "chronicle/command/handler.hpp"
#include "chronicle/history/versioned_collection.hpp"
#include "chronicle/infra/logger.hpp"
#include "chronicle/infra/string.hpp"
#include "chronicle/storage/document_store.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout
        << "Usage: " << binary_name << " [DATA_PATH] [OPTIONS]\n"
        << "Options:\n"
        << "  DATA_PATH                Directory holding the journal (Default: ./chronicle_data)\n"
        << "  --snapshot-interval N    Deltas between checkpoint snapshots (Default: 5)\n"
        << "  --metadata-key NAME      Embedded metadata key (Default: "
        << chronicle::history::kDefaultMetadataKey << ")\n"
        << "  --log-level LEVEL        trace|debug|info|warn|error|fatal (Default: info)\n"
        << "  --help                   Show this help message\n";
}

struct CliConfig {
    std::string data_path = "./chronicle_data";
    chronicle::history::Options options;
    chronicle::infra::LogLevel level = chronicle::infra::LogLevel::INFO;
};

std::string flag_value(int argc, char* argv[], int& i)
{
    if (i + 1 >= argc)
        throw std::invalid_argument(std::string("Missing value for ") + argv[i]);
    return argv[++i];
}

CliConfig parse_args(int argc, char* argv[])
{
    CliConfig config;
    bool path_seen = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--snapshot-interval") {
            config.options.num_deltas_before_snapshot = std::stoi(flag_value(argc, argv, i));
        } else if (arg == "--metadata-key") {
            config.options.internal_metadata_keyname = flag_value(argc, argv, i);
        } else if (arg == "--log-level") {
            config.level = chronicle::infra::Logger::parse_level(flag_value(argc, argv, i));
        } else if (chronicle::infra::String::starts_with(arg, "--") || path_seen) {
            throw std::invalid_argument("Unexpected argument: " + arg);
        } else {
            config.data_path = arg;
            path_seen = true;
        }
    }
    return config;
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--help") {
            print_help(argv[0]);
            return 0;
        }
    }

    auto logger = std::make_shared<chronicle::infra::Logger>(chronicle::infra::LogLevel::INFO);

    try {
        CliConfig config = parse_args(argc, argv);
        logger->set_threshold(config.level);

        logger->log(chronicle::infra::LogLevel::INFO, "System: Booting Chronicle...");
        logger->log(chronicle::infra::LogLevel::INFO,
                    "Config: Persistence Path set to '" + config.data_path + "'");
        logger->log(chronicle::infra::LogLevel::INFO,
                    "Config: Snapshot every " +
                        std::to_string(config.options.num_deltas_before_snapshot) +
                        " delta(s), metadata key '" + config.options.internal_metadata_keyname +
                        "'");

        chronicle::storage::DocumentStore store(config.data_path, logger);
        chronicle::command::Handler handler(store, config.options, logger);

        std::string line;
        while (std::getline(std::cin, line)) {
            line = chronicle::infra::String::trim(line);
            if (line.empty())
                continue;

            std::string response = handler.process(line);
            std::cout << response << std::endl;
            if (chronicle::infra::String::starts_with(response, "{\"status\":\"goodbye\""))
                break;
        }
    } catch (const std::exception& e) {
        logger->log(chronicle::infra::LogLevel::FATAL,
                    "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    logger->log(chronicle::infra::LogLevel::INFO, "System: Shutdown complete.");
    return 0;
}
