/*
 * QRLABEL LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 The qrlabel Authors.
 * See the LICENSE file at the repository root.
 *
 * This source code is licensed under the MIT License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main.cpp
 * @brief Application Entry Point.
 *
 * @details
 * Startup sequence:
 * 1. Argument parsing.
 * 2. Signal handling registration (SIGINT/SIGTERM).
 * 3. Configuration loading.
 * 4. One generation run.
 */

#include "qrlabel/core/config.hpp"
#include "qrlabel/core/pipeline.hpp"
#include "qrlabel/infra/errors.hpp"
#include "qrlabel/infra/logger.hpp"
#include "qrlabel/layout/page_writer.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

/// @brief Set by the signal handler, polled by the pipeline between identifiers.
static std::atomic<bool> g_stop{false};

/**
 * @brief SIGINT/SIGTERM handler.
 *
 * Only flips the stop flag; the pipeline finishes the current identifier,
 * writes the partial page and returns.
 */
void signal_handler(int)
{
    g_stop.store(true);
}

void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [CONFIG_PATH]\n"
              << "Options:\n"
              << "  CONFIG_PATH   JSON run configuration (Default: ./qrlabel.json)\n"
              << "  --help        Show this help message\n";
}

int main(int argc, char* argv[])
{
    if (argc > 1 && std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return 0;
    }

    std::string config_path = argc > 1 ? argv[1] : "./qrlabel.json";

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        qrlabel::core::Config config = qrlabel::core::ConfigLoader::load_file(config_path);
        qrlabel::infra::Logger::set_level(config.log_level);

        qrlabel::infra::Logger::log(qrlabel::infra::LogLevel::INFO,
                                    "Config: Loaded " + config_path + " (store '" +
                                        config.store_path + "', output '" + config.output_dir +
                                        "')");

        qrlabel::layout::FilePageWriter writer(config.output_dir);
        qrlabel::core::Pipeline pipeline(config, writer);
        qrlabel::core::RunSummary summary = pipeline.run(&g_stop);

        if (summary.interrupted) {
            qrlabel::infra::Logger::log(qrlabel::infra::LogLevel::WARN,
                                        "System: Run interrupted. Rerun to continue from the store.");
            return 130;
        }
    } catch (const qrlabel::infra::Error& e) {
        qrlabel::infra::Logger::log(qrlabel::infra::LogLevel::FATAL,
                                    "System: " + std::string(e.what()));
        return 1;
    } catch (const std::exception& e) {
        qrlabel::infra::Logger::log(qrlabel::infra::LogLevel::FATAL,
                                    "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    qrlabel::infra::Logger::log(qrlabel::infra::LogLevel::INFO, "System: Done.");
    return 0;
}
