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
 * @file page.cpp
 * @brief Cell placement and SVG rendering of a label page.
 *
 * @details
 * Each cell is drawn as:
 * - a rounded outline rectangle covering the cell,
 * - the QR image, square, anchored at the left of the cell,
 * - the token as bold text to the right of the image.
 */

#include "qrlabel/layout/page.hpp"

#include "qrlabel/infra/errors.hpp"
#include "qrlabel/infra/logger.hpp"

#include <algorithm>
#include <locale>
#include <sstream>

namespace qrlabel::layout {

namespace {

constexpr double kPadding = 2.0;
constexpr double kMaxFontSize = 10.0;
constexpr double kGlyphAdvance = 0.55; // Average advance of a narrow bold face, in em.
constexpr double kMaxCornerRadius = 7.0;

std::string format_number(double value)
{
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out.precision(6);
    out << value;
    return out.str();
}

std::string escape_xml(const std::string& text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        default:
            out.push_back(c);
        }
    }
    return out;
}

std::vector<std::string> wrap_label(const std::string& label, int width)
{
    if (width <= 0 || label.size() <= static_cast<std::size_t>(width)) {
        return {label};
    }
    std::vector<std::string> lines;
    for (std::size_t pos = 0; pos < label.size(); pos += static_cast<std::size_t>(width)) {
        lines.push_back(label.substr(pos, static_cast<std::size_t>(width)));
    }
    return lines;
}

void render_cell(std::ostringstream& svg, const Cell& cell, const Geometry& geometry)
{
    const double w = geometry.cell_width;
    const double h = geometry.cell_height;
    const double radius = std::min(kMaxCornerRadius, std::min(w, h) / 6.0);

    const double image_side = std::max(0.0, std::min(h - 2 * kPadding, w / 2.0));
    const double image_x = cell.x + kPadding;
    const double image_y = cell.y + (h - image_side) / 2.0;

    const auto lines = wrap_label(cell.label, geometry.label_wrap);
    std::size_t longest = 1;
    for (const auto& line : lines) {
        longest = std::max(longest, line.size());
    }

    const double text_x = image_x + image_side + kPadding;
    const double text_room = std::max(1.0, cell.x + w - kPadding - text_x);
    const double font_size =
        std::min({kMaxFontSize, text_room / (kGlyphAdvance * static_cast<double>(longest)),
                  (h - 2 * kPadding) / static_cast<double>(lines.size())});
    const double block = font_size * static_cast<double>(lines.size());
    const double baseline = cell.y + (h - block) / 2.0 + font_size * 0.8;

    svg << "  <g class=\"cell\" id=\"cell-" << cell.index << "\" data-row=\"" << cell.row
        << "\" data-column=\"" << cell.column << "\">\n";

    svg << "    <rect x=\"" << format_number(cell.x) << "\" y=\"" << format_number(cell.y) << "\" width=\""
        << format_number(w) << "\" height=\"" << format_number(h) << "\" rx=\"" << format_number(radius)
        << "\" ry=\"" << format_number(radius)
        << "\" fill=\"none\" stroke=\"black\" stroke-width=\"0.5\"/>\n";

    svg << "    <image x=\"" << format_number(image_x) << "\" y=\"" << format_number(image_y) << "\" width=\""
        << format_number(image_side) << "\" height=\"" << format_number(image_side)
        << "\" preserveAspectRatio=\"xMidYMid meet\" xlink:href=\"" << cell.symbol.data_uri()
        << "\"/>\n";

    svg << "    <text x=\"" << format_number(text_x) << "\" y=\"" << format_number(baseline)
        << "\" font-family=\"Arial Narrow\" font-size=\"" << format_number(font_size)
        << "\" font-weight=\"bold\" fill=\"black\">";
    if (lines.size() == 1) {
        svg << escape_xml(lines.front());
    } else {
        for (std::size_t i = 0; i < lines.size(); ++i) {
            svg << "<tspan x=\"" << format_number(text_x) << "\" y=\""
                << format_number(baseline + font_size * static_cast<double>(i)) << "\">"
                << escape_xml(lines[i]) << "</tspan>";
        }
    }
    svg << "</text>\n";

    svg << "  </g>\n";
}

} // namespace

std::size_t Geometry::capacity() const
{
    if (rows <= 0 || columns <= 0) {
        return 0;
    }
    return static_cast<std::size_t>(rows) * static_cast<std::size_t>(columns);
}

double Geometry::page_width() const
{
    return sheet_width > 0.0 ? sheet_width : 2 * margin_x + columns * cell_width;
}

double Geometry::page_height() const
{
    return sheet_height > 0.0 ? sheet_height : 2 * margin_y + rows * cell_height;
}

void Geometry::check() const
{
    if (rows < 1 || columns < 1) {
        throw infra::ConfigurationError("rows and columns must be at least 1");
    }
    if (!(cell_width > 0.0) || !(cell_height > 0.0)) {
        throw infra::ConfigurationError("cell_width and cell_height must be positive");
    }
    if (margin_x < 0.0 || margin_y < 0.0) {
        throw infra::ConfigurationError("margins must not be negative");
    }
    if (label_wrap < 0) {
        throw infra::ConfigurationError("label_wrap must not be negative");
    }
    if (sheet_width < 0.0 || sheet_height < 0.0) {
        throw infra::ConfigurationError("sheet_width and sheet_height must not be negative");
    }
    if (sheet_width > 0.0 && sheet_width < margin_x + columns * cell_width) {
        throw infra::ConfigurationError("grid does not fit within sheet_width");
    }
    if (sheet_height > 0.0 && sheet_height < margin_y + rows * cell_height) {
        throw infra::ConfigurationError("grid does not fit within sheet_height");
    }
}

LayoutPage::LayoutPage(std::size_t number, Geometry geometry)
    : number_(number), geometry_(std::move(geometry))
{
    geometry_.check();
}

void LayoutPage::place(const core::IdentifierRecord& record, codec::EncodedSymbol symbol)
{
    if (state_ == PageState::FULL || state_ == PageState::FINALIZED) {
        throw infra::Error("Page " + std::to_string(number_) + " no longer accepts cells");
    }
    if (symbol.token() != record.token) {
        throw infra::Error("Symbol for '" + symbol.token() + "' placed as '" + record.token + "'");
    }

    const std::size_t index = cells_.size();
    const int row = static_cast<int>(index / static_cast<std::size_t>(geometry_.columns));
    const int column = static_cast<int>(index % static_cast<std::size_t>(geometry_.columns));

    cells_.push_back(Cell{index, row, column, geometry_.margin_x + column * geometry_.cell_width,
                          geometry_.margin_y + row * geometry_.cell_height, record.token,
                          std::move(symbol)});

    state_ = full() ? PageState::FULL : PageState::FILLING;

    infra::Logger::log(infra::LogLevel::TRACE, "Layout: Page " + std::to_string(number_) +
                                                   " cell " + std::to_string(index) + " (r" +
                                                   std::to_string(row) + ", c" +
                                                   std::to_string(column) + ") <- " + record.token);
}

std::string LayoutPage::finalize()
{
    if (state_ == PageState::FINALIZED) {
        throw infra::Error("Page " + std::to_string(number_) + " is already finalized");
    }
    if (state_ == PageState::EMPTY) {
        throw infra::Error("Page " + std::to_string(number_) + " has no cells to finalize");
    }

    std::string svg = to_svg();
    state_ = PageState::FINALIZED;
    return svg;
}

std::string LayoutPage::to_svg() const
{
    const std::string width = format_number(geometry_.page_width());
    const std::string height = format_number(geometry_.page_height());

    std::ostringstream svg;
    svg << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    svg << "<svg xmlns=\"http://www.w3.org/2000/svg\" "
           "xmlns:xlink=\"http://www.w3.org/1999/xlink\" version=\"1.1\" width=\""
        << width << "\" height=\"" << height << "\" viewBox=\"0 0 " << width << " " << height
        << "\">\n";

    for (const auto& cell : cells_) {
        render_cell(svg, cell, geometry_);
    }

    svg << "</svg>\n";
    return svg.str();
}

std::string LayoutPage::first_token() const
{
    return cells_.empty() ? std::string() : cells_.front().label;
}

std::string LayoutPage::last_token() const
{
    return cells_.empty() ? std::string() : cells_.back().label;
}

} // namespace qrlabel::layout
