/**
 * @file SlotTable.hpp
 * @brief The player's side of the machine: stake, bet and runtime settings.
 */

#pragma once

#include "FrameTime.hpp"
#include "SlotMachine.hpp"
#include "Wallet.hpp"
#include "WinEvaluator.hpp"

#include <string>
#include <vector>

enum class BetChange { Changed, OutOfRange, Locked };

const char* toString(BetChange change);

/**
 * @brief Joins a machine and a wallet.
 *
 * Installs the wallet as the machine's stake check, takes the bet when a spin
 * is accepted and pays results out against the bet that was actually staked.
 * Lives on the frame thread with the machine.
 */
class SlotTable {
public:
    SlotTable(SlotMachine& machine, Wallet& wallet);
    ~SlotTable();

    SlotTable(const SlotTable&) = delete;
    SlotTable& operator=(const SlotTable&) = delete;

    // Spin with the current settings; the bet is debited only when accepted.
    SpinStatus spin(TimePoint now);

    // The bet is locked while the reels spin.
    BetChange setBet(int bet);

    /**
     * @brief Award the payout and classify it.
     * @return the tier of the payout relative to the bet staked on that spin.
     */
    WinTier settle(const WinResult& result);

    int stakedBet() const { return stakedBet_; }

    /**
     * @brief Re-read the runtime settings (speed, instant, bet) from config text.
     *
     * Keys missing from `text` keep their current values. Nothing is applied
     * when the merged settings do not validate. Every other key only takes
     * effect at startup; changing one is reported and ignored.
     *
     * @param problems Receives one readable message per rejected line or setting.
     * @return true when every setting in the text was applied.
     */
    bool reload(const std::string& text, std::vector<std::string>& problems);

    SlotMachine& machine() { return machine_; }
    const SlotMachine& machine() const { return machine_; }
    Wallet& wallet() { return wallet_; }
    const Wallet& wallet() const { return wallet_; }

private:
    SlotMachine& machine_;
    Wallet& wallet_;
    int stakedBet_;
};
