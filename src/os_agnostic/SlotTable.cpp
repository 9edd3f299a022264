/**
 * @file SlotTable.cpp
 * @brief The player's side of the machine: stake, bet and runtime settings.
 */

#include "SlotTable.hpp"
#include "Log.hpp"

const char* toString(BetChange change) {
    switch (change) {
        case BetChange::Changed:    return "changed";
        case BetChange::OutOfRange: return "out of range";
        case BetChange::Locked:     return "locked while the reels spin";
    }
    return "unknown";
}

SlotTable::SlotTable(SlotMachine& machine, Wallet& wallet)
    : machine_(machine), wallet_(wallet), stakedBet_(wallet.bet()) {
    machine_.coordinator().setStakeCheck([this] { return wallet_.canAffordBet(); });
}

SlotTable::~SlotTable() {
    machine_.coordinator().setStakeCheck(nullptr);
}

SpinStatus SlotTable::spin(TimePoint now) {
    // An instant spin settles inside machine_.spin(), so the stake is recorded first.
    const int previous = stakedBet_;
    stakedBet_ = wallet_.bet();

    SpinTicket ticket = machine_.spin(now);
    if (!ticket.accepted()) {
        stakedBet_ = previous;
        return ticket.status;
    }
    // the stake check passed inside spin() for this same bet
    if (!wallet_.debitBet()) Log::error("table: bet could not be debited after acceptance");
    return ticket.status;
}

BetChange SlotTable::setBet(int bet) {
    if (machine_.coordinator().isSpinning()) return BetChange::Locked;
    if (!wallet_.setBet(bet)) return BetChange::OutOfRange;
    return BetChange::Changed;
}

WinTier SlotTable::settle(const WinResult& result) {
    wallet_.award(result.payout);
    return WinEvaluator::classify(result.payout, stakedBet_);
}

bool SlotTable::reload(const std::string& text, std::vector<std::string>& problems) {
    const SlotConfig& current = machine_.config();

    SlotConfig next = current;
    next.bet = wallet_.bet();
    bool ok = next.load(text, &problems);

    if (auto problem = next.validate()) {
        problems.push_back(*problem);
        Log::warn("table: reload rejected: " + *problem);
        return false;
    }

    SlotConfig runtimeOnly = current;
    runtimeOnly.speed = next.speed;
    runtimeOnly.instant = next.instant;
    runtimeOnly.bet = next.bet;
    if (!(next == runtimeOnly)) {
        problems.push_back("only speed, instant and bet change at runtime; other keys ignored");
        ok = false;
    }

    machine_.setSpeed(next.speed);
    machine_.setInstant(next.instant);

    if (next.bet != wallet_.bet()) {
        const BetChange change = setBet(next.bet);
        if (change != BetChange::Changed) {
            problems.push_back("bet " + std::to_string(next.bet) + " not applied: " + toString(change));
            ok = false;
        }
    }

    Log::info(std::string("table: settings reloaded, speed ") + toString(next.speed) +
              (next.instant ? ", instant" : "") + ", bet " + std::to_string(wallet_.bet()));
    return ok;
}
