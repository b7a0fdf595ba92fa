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
 * @file assembler.cpp
 * @brief Page rotation for the label layout.
 */

#include "qrlabel/layout/assembler.hpp"

#include "qrlabel/infra/errors.hpp"
#include "qrlabel/infra/logger.hpp"

namespace qrlabel::layout {

LayoutAssembler::LayoutAssembler(Geometry geometry, PageWriter& writer)
    : geometry_(std::move(geometry)), writer_(writer)
{
    geometry_.check();
}

void LayoutAssembler::place(const core::IdentifierRecord& record, codec::EncodedSymbol symbol)
{
    if (finished_) {
        throw infra::Error("Layout assembler already finished");
    }

    if (!current_) {
        current_.emplace(next_page_number_++, geometry_);
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Layout: Opened page " + std::to_string(current_->number()));
    }

    current_->place(record, std::move(symbol));

    if (current_->state() == PageState::FULL) {
        flush_current();
    }
}

void LayoutAssembler::finish()
{
    if (finished_) {
        return;
    }
    finished_ = true;

    if (current_) {
        flush_current();
    }
}

void LayoutAssembler::flush_current()
{
    std::string svg = current_->finalize();
    outputs_.push_back(writer_.write(*current_, svg));
    current_.reset();
}

} // namespace qrlabel::layout
