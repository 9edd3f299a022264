/**
 * @file Grid.hpp
 * @brief Symbol grid values and the grid model the reels render from.
 */

#pragma once

#include <string>
#include <vector>

// Symbol identifier, 0..K-1. Carries no behavior of its own.
using Symbol = int;

struct CellPos {
    int row = 0;
    int col = 0;

    bool operator==(const CellPos&) const = default;
    bool operator<(const CellPos& o) const {
        return row != o.row ? row < o.row : col < o.col;
    }
};

/**
 * @brief Row-major R x C matrix of symbols.
 *
 * A plain value: copied into a spin session when committed, compared by
 * content in tests.
 */
class Grid {
public:
    Grid() = default;
    Grid(int rows, int cols, Symbol fill = 0);

    int rows() const { return rows_; }
    int cols() const { return cols_; }

    Symbol at(int row, int col) const { return cells_[index(row, col)]; }
    void set(int row, int col, Symbol s) { cells_[index(row, col)] = s; }

    std::vector<Symbol> row(int r) const;
    std::vector<Symbol> column(int c) const;

    bool sameShape(const Grid& o) const { return rows_ == o.rows_ && cols_ == o.cols_; }

    bool operator==(const Grid&) const = default;

private:
    int rows_{0};
    int cols_{0};
    std::vector<Symbol> cells_;

    std::size_t index(int row, int col) const {
        return static_cast<std::size_t>(row) * cols_ + col;
    }
};

/**
 * @brief Ready-to-display handles supplied by the rendering side, one per Symbol id.
 */
struct SymbolAtlas {
    std::vector<std::string> glyphs;
};

/**
 * @brief Visual container of one reel column.
 *
 * The strip holds two copies of the column (2 x rows slots) so a scroll
 * offset wrapped at the cycle distance always has symbols to show.
 */
struct ReelColumn {
    int index = 0;
    double restOffset = 0.0;      // rendered position at rest
    double scrollOffset = 0.0;    // grows during a spin, reset to 0 on start
    double renderedOffset = 0.0;  // restOffset + scrollOffset mod cycle
    bool cueActive = false;       // per-column spin effect
    std::vector<Symbol> strip;
};

/**
 * @brief The machine's displayed grid plus its column containers.
 *
 * Only the spin coordinator writes cells (through commitColumn); animators
 * only move the column containers.
 */
class GridModel {
public:
    GridModel(int rows, int cols, double rowHeight);

    /**
     * @brief Bind symbol handles from the rendering collaborator.
     * @return false (and stays unbound) when fewer than symbolCount usable glyphs are supplied.
     */
    bool bind(const SymbolAtlas& atlas, int symbolCount);
    bool isBound() const { return bound_; }

    // Fill every cell at startup; shape must match.
    bool initialize(const Grid& initial);

    /**
     * @brief Copy column `col` of `committed` into the cells and the column strip.
     * @return false on a shape mismatch or out-of-range column; nothing is written then.
     */
    bool commitColumn(int col, const Grid& committed);

    const Grid& cells() const { return cells_; }
    int rows() const { return cells_.rows(); }
    int cols() const { return cells_.cols(); }

    ReelColumn& column(int c) { return columns_[c]; }
    const ReelColumn& column(int c) const { return columns_[c]; }

    double rowHeight() const { return rowHeight_; }
    double cycleDistance() const { return rowHeight_ * cells_.rows(); }

    const std::string& glyph(Symbol s) const;

private:
    Grid cells_;
    std::vector<ReelColumn> columns_;
    std::vector<std::string> glyphs_;
    double rowHeight_;
    bool bound_{false};
};
