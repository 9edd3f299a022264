/**
 * @file ResultGenerator.hpp
 * @brief Draws the committed outcome of a spin.
 */

#pragma once

#include "Grid.hpp"

#include <cstdint>
#include <random>

/**
 * @brief Uniform, independent draw of every cell of the outcome grid.
 *
 * Every symbol type has equal probability and cells are drawn independently;
 * there is no weighting and no reel strip. The generator owns its random
 * engine and touches nothing else.
 */
class ResultGenerator {
public:
    // Seeded from std::random_device.
    ResultGenerator(int rows, int cols, int symbolCount);

    // Deterministic sequence for a given seed.
    ResultGenerator(int rows, int cols, int symbolCount, std::uint32_t seed);

    Grid generate();

    int rows() const { return rows_; }
    int cols() const { return cols_; }
    int symbolCount() const { return symbolCount_; }

private:
    int rows_;
    int cols_;
    int symbolCount_;
    std::mt19937 engine_;
};
