/**
 * @file Grid.cpp
 * @brief Symbol grid values and the grid model the reels render from.
 */

#include "Grid.hpp"
#include "Log.hpp"

#include <algorithm>

Grid::Grid(int rows, int cols, Symbol fill)
    : rows_(std::max(0, rows)), cols_(std::max(0, cols)),
      cells_(static_cast<std::size_t>(rows_) * cols_, fill) {}

std::vector<Symbol> Grid::row(int r) const {
    return std::vector<Symbol>(cells_.begin() + r * cols_, cells_.begin() + (r + 1) * cols_);
}

std::vector<Symbol> Grid::column(int c) const {
    std::vector<Symbol> out;
    out.reserve(rows_);
    for (int r = 0; r < rows_; ++r) out.push_back(at(r, c));
    return out;
}

GridModel::GridModel(int rows, int cols, double rowHeight)
    : cells_(rows, cols), rowHeight_(rowHeight) {
    columns_.resize(cells_.cols());
    for (int c = 0; c < cells_.cols(); ++c) {
        columns_[c].index = c;
        columns_[c].strip.assign(static_cast<std::size_t>(cells_.rows()) * 2, 0);
    }
}

bool GridModel::bind(const SymbolAtlas& atlas, int symbolCount) {
    if (symbolCount <= 0 || static_cast<int>(atlas.glyphs.size()) < symbolCount) {
        Log::error("grid: atlas supplies " + std::to_string(atlas.glyphs.size()) +
                   " glyphs, " + std::to_string(symbolCount) + " required");
        return false;
    }
    for (int i = 0; i < symbolCount; ++i) {
        if (atlas.glyphs[i].empty()) {
            Log::error("grid: no glyph for symbol " + std::to_string(i));
            return false;
        }
    }

    glyphs_.assign(atlas.glyphs.begin(), atlas.glyphs.begin() + symbolCount);
    bound_ = true;
    return true;
}

bool GridModel::initialize(const Grid& initial) {
    if (!initial.sameShape(cells_)) {
        Log::error("grid: initial grid shape does not match the model");
        return false;
    }
    for (int c = 0; c < cols(); ++c) commitColumn(c, initial);
    return true;
}

bool GridModel::commitColumn(int col, const Grid& committed) {
    if (!committed.sameShape(cells_) || col < 0 || col >= cols()) return false;

    ReelColumn& column = columns_[col];
    const int rows = cells_.rows();
    for (int r = 0; r < rows; ++r) {
        const Symbol s = committed.at(r, col);
        cells_.set(r, col, s);
        column.strip[r] = s;
        column.strip[r + rows] = s;
    }
    return true;
}

const std::string& GridModel::glyph(Symbol s) const {
    static const std::string unknown{"?"};
    if (s < 0 || s >= static_cast<int>(glyphs_.size())) return unknown;
    return glyphs_[s];
}
