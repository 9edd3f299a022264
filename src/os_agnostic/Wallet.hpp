/**
 * @file Wallet.hpp
 * @brief Credit balance and bet of the player at the console.
 */

#pragma once

/**
 * @brief The stake collaborator: decides whether a spin may start and applies payouts.
 *
 * Lives on the frame thread with the machine. The machine never touches
 * credits; the console debits the bet when a spin is accepted and awards
 * the payout when it resolves.
 */
class Wallet {
public:
    Wallet(int credits, int bet, int minBet, int maxBet);

    int credits() const { return credits_; }
    int bet() const { return bet_; }
    int minBet() const { return minBet_; }
    int maxBet() const { return maxBet_; }

    // false (bet unchanged) outside [minBet, maxBet].
    bool setBet(int bet);

    bool canAffordBet() const { return credits_ >= bet_; }

    // false (nothing taken) when the balance does not cover the bet.
    bool debitBet();

    void award(int amount);

private:
    int credits_;
    int bet_;
    int minBet_;
    int maxBet_;
};
