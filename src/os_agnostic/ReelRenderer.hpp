/**
 * @file ReelRenderer.hpp
 * @brief Composes the reel window as text lines, one frame at a time.
 */

#pragma once

#include "Grid.hpp"
#include "HighlightLayer.hpp"

#include <string>
#include <vector>

/*
    Pure frame composition: box borders, each column's strip at its current
    scroll offset, win brackets and a status line. No threads and no engine
    state changes; DisplayHandler asks for a frame every tick.
*/
class ReelRenderer {
public:
    explicit ReelRenderer(int cellWidth);

    std::vector<std::string> buildFrame(const GridModel& model, const HighlightLayer& highlights,
                                        const std::string& status) const;

    // Lines produced by buildFrame for this model.
    int frameHeight(const GridModel& model) const { return model.rows() + 4; }

    // Symbol showing in window row `row` of a column scrolled to its current offset.
    static Symbol visibleSymbol(const ReelColumn& column, int row, int rows, double rowHeight);

private:
    int cellWidth_;

    std::string cell(const std::string& glyph, bool highlighted) const;
};
