/**
 * @file AutoSpinner.cpp
 * @brief Repeats spins for a number of rounds, or until told to stop.
 */

#include "AutoSpinner.hpp"
#include "Log.hpp"

AutoSpinner::AutoSpinner(SlotTable& table) : table_(table) {
    table_.machine().coordinator().addListener(this);
}

AutoSpinner::~AutoSpinner() {
    table_.machine().coordinator().removeListener(this);
}

bool AutoSpinner::start(int count, TimePoint now) {
    if (active_) return false;
    if (count == 0 || count < kInfinite) return false;

    active_ = true;
    waiting_ = false;
    resolved_ = false;
    stopRequested_ = false;
    remaining_ = count;
    spinsStarted_ = 0;
    nextAt_ = now;
    lastStopReason_.clear();

    Log::info(count == kInfinite ? std::string("auto: started, until stopped")
                                 : "auto: started, " + std::to_string(count) + " rounds");
    return true;
}

void AutoSpinner::requestStop() {
    if (!active_) return;
    if (!waiting_) {
        finish("stopped");
        return;
    }
    stopRequested_ = true;
}

void AutoSpinner::cancel() {
    if (active_) finish("cancelled");
}

void AutoSpinner::onSpinResolved(const WinResult&) {
    if (!active_ || !waiting_) return;
    waiting_ = false;
    resolved_ = true;
}

void AutoSpinner::settleRound(TimePoint now) {
    if (!resolved_) return;
    resolved_ = false;

    if (stopRequested_) {
        finish("stopped");
    } else if (remaining_ == 0) {
        finish("completed");
    } else {
        const Millis delay = presetFor(table_.machine().config().speed).autoSpinDelay;
        nextAt_ = now + std::chrono::duration_cast<FrameClock::duration>(delay);
    }
}

void AutoSpinner::tick(TimePoint now) {
    if (!active_) return;

    settleRound(now);
    if (!active_ || waiting_ || now < nextAt_) return;
    if (table_.machine().isPaused()) return;

    // set before spinning: an instant round resolves inside spin()
    waiting_ = true;
    const SpinStatus status = table_.spin(now);

    if (status == SpinStatus::Accepted) {
        ++spinsStarted_;
        if (remaining_ > 0) --remaining_;
        settleRound(now);
        return;
    }

    waiting_ = false;
    if (status == SpinStatus::Busy) return;  // a manual spin is running; try next frame
    finish(toString(status));
}

void AutoSpinner::finish(const std::string& reason) {
    active_ = false;
    waiting_ = false;
    resolved_ = false;
    stopRequested_ = false;
    lastStopReason_ = reason;

    Log::info("auto: finished after " + std::to_string(spinsStarted_) + " rounds (" + reason + ")");
    if (onFinished_) onFinished_(reason);
}
