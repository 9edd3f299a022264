/**
 * @file HighlightLayer.cpp
 * @brief Win highlight markers drawn over the settled grid.
 */

#include "HighlightLayer.hpp"
#include "Log.hpp"

HighlightLayer::HighlightLayer(std::size_t capacity) : pool_(capacity) {
    active_.reserve(capacity);
}

std::size_t HighlightLayer::show(const WinResult& result, const GridModel& model) {
    clear();

    for (const CellPos& cell : result.highlights) {
        HighlightMarker* marker = pool_.acquire();
        if (!marker) {
            Log::warn("highlight: pool exhausted, " +
                      std::to_string(result.highlights.size() - active_.size()) + " cell(s) not marked");
            break;
        }
        marker->cell = cell;
        marker->glyph = model.glyph(model.cells().at(cell.row, cell.col));
        marker->visible = true;
        active_.push_back(marker);
    }
    return active_.size();
}

void HighlightLayer::clear() {
    for (HighlightMarker* m : active_) pool_.release(m);
    active_.clear();
}

bool HighlightLayer::isHighlighted(int row, int col) const {
    for (const HighlightMarker* m : active_) {
        if (m->visible && m->cell.row == row && m->cell.col == col) return true;
    }
    return false;
}
