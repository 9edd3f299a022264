/**
 * @file AutoSpinner.hpp
 * @brief Repeats spins for a number of rounds, or until told to stop.
 */

#pragma once

#include "FrameTime.hpp"
#include "SlotTable.hpp"
#include "SpinCoordinator.hpp"

#include <functional>
#include <string>

/**
 * @class AutoSpinner
 * @brief Frame-driven auto-spin run.
 *
 * Nothing sleeps: the frame loop calls tick(), which starts the next round
 * once the previous one has resolved and the speed preset's autoSpinDelay has
 * passed. A stop request takes effect after the round in flight resolves.
 * The run ends on its own when a spin is refused (e.g. out of credits).
 *
 * Frame thread only, like the machine.
 */
class AutoSpinner : public SpinListener {
public:
    static constexpr int kInfinite = -1;

    explicit AutoSpinner(SlotTable& table);
    ~AutoSpinner() override;

    AutoSpinner(const AutoSpinner&) = delete;
    AutoSpinner& operator=(const AutoSpinner&) = delete;

    /**
     * @brief Begin a run. The first round starts on the next tick at or after `now`.
     * @param count Number of rounds, or kInfinite.
     * @return false for a count of zero, a negative count other than kInfinite,
     *         or when a run is already active.
     */
    bool start(int count, TimePoint now);

    // Ends the run after the round in flight; at once if none is.
    void requestStop();

    // Ends the run immediately without waiting for the round in flight.
    void cancel();

    void tick(TimePoint now);

    bool isActive() const { return active_; }
    bool isInfinite() const { return remaining_ == kInfinite; }
    bool stopRequested() const { return stopRequested_; }
    int remaining() const { return remaining_; }
    int spinsStarted() const { return spinsStarted_; }

    // "completed", "stopped", "cancelled" or the refused spin's status text.
    const std::string& lastStopReason() const { return lastStopReason_; }

    void setOnFinished(std::function<void(const std::string&)> cb) { onFinished_ = std::move(cb); }

    // >>> SpinListener
    void onSpinResolved(const WinResult& result) override;

private:
    SlotTable& table_;

    bool active_{false};
    bool waiting_{false};    // a round of this run is spinning
    bool resolved_{false};   // that round resolved since the last tick
    bool stopRequested_{false};
    int remaining_{0};
    int spinsStarted_{0};
    TimePoint nextAt_{};
    std::string lastStopReason_;
    std::function<void(const std::string&)> onFinished_;

    void settleRound(TimePoint now);
    void finish(const std::string& reason);
};
