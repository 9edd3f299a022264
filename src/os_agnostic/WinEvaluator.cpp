/**
 * @file WinEvaluator.cpp
 * @brief Scans a settled grid for winning runs and prices them.
 */

#include "WinEvaluator.hpp"

#include <algorithm>
#include <set>

const char* toString(WinTier tier) {
    switch (tier) {
        case WinTier::None: return "none";
        case WinTier::Big:  return "BIG WIN";
        case WinTier::Mega: return "MEGA WIN";
        case WinTier::Epic: return "EPIC WIN";
    }
    return "none";
}

WinEvaluator::WinEvaluator(int creditsPerMatch, int minRun)
    : creditsPerMatch_(creditsPerMatch), minRun_(std::max(1, minRun)) {}

WinResult WinEvaluator::evaluate(const Grid& grid) const {
    WinResult result;
    std::set<CellPos> cells;
    std::set<int> columns;

    for (int r = 0; r < grid.rows(); ++r) {
        if (grid.cols() == 0) break;

        const Symbol first = grid.at(r, 0);
        int run = 1;
        while (run < grid.cols() && grid.at(r, run) == first) ++run;

        if (run < minRun_) continue;

        result.payout += run * creditsPerMatch_;
        result.winningRows.push_back(r);
        if (!result.drivingSymbol) result.drivingSymbol = first;

        for (int c = 0; c < run; ++c) {
            cells.insert(CellPos{r, c});
            columns.insert(c);
        }
    }

    result.highlights.assign(cells.begin(), cells.end());
    result.winningColumns.assign(columns.begin(), columns.end());
    return result;
}

WinTier WinEvaluator::classify(int payout, int bet) {
    if (bet <= 0 || payout <= 0) return WinTier::None;

    const double multiplier = static_cast<double>(payout) / bet;
    if (multiplier >= 50.0) return WinTier::Epic;
    if (multiplier >= 20.0) return WinTier::Mega;
    if (multiplier >= 10.0) return WinTier::Big;
    return WinTier::None;
}
