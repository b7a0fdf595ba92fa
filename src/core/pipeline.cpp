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
 * @file pipeline.cpp
 * @brief Implementation of the generation run.
 */

#include "qrlabel/core/pipeline.hpp"

#include "qrlabel/codec/qr_encoder.hpp"
#include "qrlabel/core/generator.hpp"
#include "qrlabel/infra/errors.hpp"
#include "qrlabel/infra/logger.hpp"
#include "qrlabel/layout/assembler.hpp"
#include "qrlabel/storage/duplicate_store.hpp"

#include <algorithm>

namespace qrlabel::core {

Pipeline::Pipeline(Config config, layout::PageWriter& writer)
    : config_(std::move(config)), writer_(writer)
{
    config_.validate();
}

RunSummary Pipeline::run(const std::atomic<bool>* stop)
{
    RunSummary summary;

    TokenFormat format = TokenFormat::from_options(config_.format);
    IdentifierGenerator generator(config_.series, format);

    storage::DuplicateStore store(config_.store_path, format);
    storage::LoadReport report = store.load();
    summary.skipped_rows = report.skipped_rows;

    std::uint64_t last_sequence =
        std::max(store.max_sequence_for(config_.series), config_.first_sequence - 1);

    // Refuse a batch that cannot be completed before committing any of it.
    const std::uint64_t capacity = format.sequence_capacity();
    const std::uint64_t available = last_sequence < capacity ? capacity - last_sequence : 0;
    if (config_.count > available) {
        throw infra::SequenceExhaustedError(
            "requested " + std::to_string(config_.count) + " identifiers but only " +
            std::to_string(available) + " sequences remain after " +
            std::to_string(last_sequence) + " (capacity " + std::to_string(capacity) + ")");
    }

    layout::LayoutAssembler assembler(config_.geometry, writer_);

    infra::Logger::log(infra::LogLevel::INFO,
                       "Pipeline: Issuing " + std::to_string(config_.count) +
                           " identifiers after sequence " + std::to_string(last_sequence) + " (" +
                           std::to_string(config_.geometry.capacity()) + " per page).");

    for (std::size_t i = 0; i < config_.count; ++i) {
        if (stop && stop->load()) {
            infra::Logger::log(infra::LogLevel::WARN, "Pipeline: Stop requested after " +
                                                          std::to_string(i) + " identifiers.");
            summary.interrupted = true;
            break;
        }

        IdentifierRecord record = generator.next(store.tokens(), last_sequence);
        codec::EncodedSymbol symbol = codec::QrEncoder::encode(record.token, config_.encode);

        // Committed before it can reach a page, so a printed label is never reissued.
        store.append(record);
        last_sequence = record.sequence;
        summary.tokens.push_back(record.token);

        assembler.place(record, std::move(symbol));
    }

    assembler.finish();
    summary.pages = assembler.outputs();

    if (summary.tokens.empty()) {
        infra::Logger::log(infra::LogLevel::INFO, "Pipeline: Nothing issued.");
    } else {
        infra::Logger::log(infra::LogLevel::INFO,
                           "Pipeline: Issued " + std::to_string(summary.tokens.size()) + " (" +
                               summary.tokens.front() + " .. " + summary.tokens.back() +
                               ") on " + std::to_string(summary.pages.size()) + " pages.");
    }
    return summary;
}

} // namespace qrlabel::core
