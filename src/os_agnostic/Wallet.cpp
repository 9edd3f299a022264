/**
 * @file Wallet.cpp
 * @brief Credit balance and bet of the player at the console.
 */

#include "Wallet.hpp"
#include "Log.hpp"

#include <algorithm>
#include <string>

Wallet::Wallet(int credits, int bet, int minBet, int maxBet)
    : credits_(std::max(0, credits)),
      minBet_(std::max(1, minBet)),
      maxBet_(std::max(std::max(1, minBet), maxBet)) {
    bet_ = std::clamp(bet, minBet_, maxBet_);
}

bool Wallet::setBet(int bet) {
    if (bet < minBet_ || bet > maxBet_) return false;
    bet_ = bet;
    return true;
}

bool Wallet::debitBet() {
    if (!canAffordBet()) return false;
    credits_ -= bet_;
    Log::debug("wallet: bet " + std::to_string(bet_) + " taken, balance " + std::to_string(credits_));
    return true;
}

void Wallet::award(int amount) {
    if (amount <= 0) return;
    credits_ += amount;
    Log::debug("wallet: awarded " + std::to_string(amount) + ", balance " + std::to_string(credits_));
}
