/**
 * @file HighlightLayer.hpp
 * @brief Win highlight markers drawn over the settled grid.
 */

#pragma once

#include "Grid.hpp"
#include "ObjectPool.hpp"
#include "WinEvaluator.hpp"

#include <string>
#include <vector>

struct HighlightMarker {
    CellPos cell{-1, -1};
    std::string glyph;  // texture reference of the highlighted symbol
    bool visible = false;

    void clear() {
        cell = CellPos{-1, -1};
        glyph.clear();
        visible = false;
    }
};

/**
 * @brief Shows one pooled marker per highlighted cell of the last result.
 *
 * Markers are drawn from a pool sized to the grid and all go back on clear(),
 * which the console calls when the next spin starts.
 */
class HighlightLayer {
public:
    explicit HighlightLayer(std::size_t capacity);

    // Replaces whatever is shown. Returns the number of markers placed.
    std::size_t show(const WinResult& result, const GridModel& model);
    void clear();

    bool isHighlighted(int row, int col) const;
    std::size_t activeCount() const { return active_.size(); }
    std::size_t available() const { return pool_.available(); }

private:
    ObjectPool<HighlightMarker> pool_;
    std::vector<HighlightMarker*> active_;
};
