/**
 * @file ReelRenderer.cpp
 * @brief Composes the reel window as text lines, one frame at a time.
 */

#include "ReelRenderer.hpp"

#include <algorithm>
#include <cmath>

ReelRenderer::ReelRenderer(int cellWidth) : cellWidth_(std::max(3, cellWidth)) {}

Symbol ReelRenderer::visibleSymbol(const ReelColumn& column, int row, int rows, double rowHeight) {
    if (rows <= 0 || column.strip.empty()) return 0;

    int shift = 0;
    if (rowHeight > 0.0) {
        shift = static_cast<int>(std::floor((column.renderedOffset - column.restOffset) / rowHeight)) % rows;
    }
    // the strip moves down, so window row r shows the slot `shift` rows above it
    const int idx = ((row - shift) % rows + rows) % rows;
    return column.strip[idx];
}

std::string ReelRenderer::cell(const std::string& glyph, bool highlighted) const {
    const int inner = cellWidth_ - 2;
    std::string g = glyph.substr(0, inner);

    int left = (inner - static_cast<int>(g.size())) / 2;
    int right = inner - static_cast<int>(g.size()) - left;
    std::string body = std::string(left, ' ') + g + std::string(right, ' ');

    if (highlighted) return "[" + body + "]";
    return " " + body + " ";
}

std::vector<std::string> ReelRenderer::buildFrame(const GridModel& model, const HighlightLayer& highlights,
                                                  const std::string& status) const {
    const int rows = model.rows();
    const int cols = model.cols();

    std::string border = "+";
    for (int c = 0; c < cols; ++c) border += std::string(cellWidth_, '-') + "+";

    std::vector<std::string> lines;
    lines.reserve(rows + 4);
    lines.push_back(border);

    for (int r = 0; r < rows; ++r) {
        std::string line = "|";
        for (int c = 0; c < cols; ++c) {
            const ReelColumn& column = model.column(c);
            if (column.cueActive) {
                line += cell(model.glyph(visibleSymbol(column, r, rows, model.rowHeight())), false);
            } else {
                // at rest the window shows the committed cells
                line += cell(model.glyph(model.cells().at(r, c)), highlights.isHighlighted(r, c));
            }
            line += "|";
        }
        lines.push_back(line);
    }

    lines.push_back(border);

    // spin cue under each moving column
    std::string cue = " ";
    for (int c = 0; c < cols; ++c) {
        cue += model.column(c).cueActive ? std::string(cellWidth_, '~') : std::string(cellWidth_, ' ');
        cue += " ";
    }
    lines.push_back(cue);
    lines.push_back(status);
    return lines;
}
