/**
 * @file WinEvaluator.hpp
 * @brief Scans a settled grid for winning runs and prices them.
 */

#pragma once

#include "Grid.hpp"

#include <optional>
#include <vector>

/**
 * @brief Outcome of one settled spin.
 */
struct WinResult {
    int payout = 0;
    std::optional<Symbol> drivingSymbol;  // symbol of the first qualifying row, top to bottom
    std::vector<CellPos> highlights;      // row-major, no duplicates
    std::vector<int> winningRows;
    std::vector<int> winningColumns;      // ascending, distinct

    bool isWin() const { return payout > 0; }

    bool operator==(const WinResult&) const = default;
};

enum class WinTier { None, Big, Mega, Epic };

const char* toString(WinTier tier);

/**
 * @brief Left-to-right run scan over each horizontal row.
 *
 * A row pays when the run that starts at column 0 is at least minRun long;
 * the first mismatch ends the run. Each paying row is worth
 * runLength * creditsPerMatch. Pure and deterministic.
 */
class WinEvaluator {
public:
    explicit WinEvaluator(int creditsPerMatch = 10, int minRun = 3);

    WinResult evaluate(const Grid& grid) const;

    // Big at 10x the bet, Mega at 20x, Epic at 50x.
    static WinTier classify(int payout, int bet);

    int creditsPerMatch() const { return creditsPerMatch_; }
    int minRun() const { return minRun_; }

private:
    int creditsPerMatch_;
    int minRun_;
};
