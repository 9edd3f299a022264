/**
 * @file ResultGenerator.cpp
 * @brief Draws the committed outcome of a spin.
 */

#include "ResultGenerator.hpp"

#include <algorithm>

ResultGenerator::ResultGenerator(int rows, int cols, int symbolCount)
    : ResultGenerator(rows, cols, symbolCount, std::random_device{}()) {}

ResultGenerator::ResultGenerator(int rows, int cols, int symbolCount, std::uint32_t seed)
    : rows_(rows), cols_(cols), symbolCount_(std::max(1, symbolCount)), engine_(seed) {}

Grid ResultGenerator::generate() {
    std::uniform_int_distribution<Symbol> pick(0, symbolCount_ - 1);

    Grid out(rows_, cols_);
    for (int r = 0; r < rows_; ++r) {
        for (int c = 0; c < cols_; ++c) {
            out.set(r, c, pick(engine_));
        }
    }
    return out;
}
