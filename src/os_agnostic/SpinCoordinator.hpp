/**
 * @file SpinCoordinator.hpp
 * @brief Runs one spin across all reel columns, from committed outcome to win result.
 */

#pragma once

#include "ColumnAnimator.hpp"
#include "FrameTime.hpp"
#include "Grid.hpp"
#include "PauseController.hpp"
#include "ResultGenerator.hpp"
#include "WinEvaluator.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Timing policy of one spin.
 *
 * Column i runs for baseDuration + i * stagger, so columns stop left to
 * right. Instant skips animation entirely.
 */
struct SpinTiming {
    Millis baseDuration{1500.0};
    Millis stagger{200.0};
    double scrollSpeed = 10.0;
    bool instant = false;

    Millis durationFor(int col) const { return baseDuration + stagger * col; }
};

enum class SpinStatus { Accepted, Busy, InsufficientStake, InvalidConfig, NotReady };

const char* toString(SpinStatus status);

/**
 * @brief Answer to a spin request. The future is only valid when accepted().
 */
struct SpinTicket {
    SpinStatus status = SpinStatus::NotReady;
    std::future<WinResult> result;

    bool accepted() const { return status == SpinStatus::Accepted; }
};

/**
 * @brief Observer of spin milestones (sound, effects, credit collaborators).
 *
 * Called on the frame thread. Column numbers are 1-based.
 */
class SpinListener {
public:
    virtual ~SpinListener() = default;

    virtual void onSpinStarted() {}
    virtual void onColumnStopped(int columnNumber) { (void)columnNumber; }
    virtual void onSpinResolved(const WinResult& result) { (void)result; }
};

/**
 * @brief The one in-flight spin. The committed grid is written once, at creation.
 */
struct SpinSession {
    Grid committed;
    std::vector<bool> stopped;
    std::vector<std::shared_future<void>> completions;
    std::promise<WinResult> promise;
    TimePoint startedAt{};
    bool instant = false;

    int stoppedCount() const;
    bool allStopped() const { return stoppedCount() == static_cast<int>(stopped.size()); }
};

/**
 * @brief Orchestrates the column animators for each spin.
 *
 * spin() draws the outcome before any frame runs and starts every column;
 * tick() is the per-frame callback that steps the animators in column order
 * and commits each column's slice of the outcome the moment it stops. When
 * the last column stops the settled grid is evaluated and the ticket's future
 * is fulfilled. The instant policy goes through the same commit and resolve
 * path without waiting for frames.
 *
 * Only this class writes grid cells. One session at a time; a spin request
 * during a session is rejected, never queued.
 */
class SpinCoordinator {
public:
    SpinCoordinator(GridModel& model, ResultGenerator& generator, PauseController& pause,
                    WinEvaluator evaluator, Millis referenceFrame);

    SpinCoordinator(const SpinCoordinator&) = delete;
    SpinCoordinator& operator=(const SpinCoordinator&) = delete;

    void addListener(SpinListener* listener);
    void removeListener(SpinListener* listener);

    // Asked before every spin; a false answer rejects with InsufficientStake.
    void setStakeCheck(std::function<bool()> check) { stakeCheck_ = std::move(check); }

    SpinTicket spin(const SpinTiming& timing, TimePoint now);

    // Per-frame callback.
    void tick(TimePoint now);

    /**
     * @brief Stop all per-frame work for good.
     *
     * Resets every animator and drops any in-flight session, whose future then
     * reports broken_promise. Later spin() calls answer NotReady and tick() does nothing.
     */
    void teardown();

    bool isSpinning() const { return session_ != nullptr; }
    bool isTornDown() const { return tornDown_; }

    const SpinSession* session() const { return session_.get(); }
    const std::optional<WinResult>& lastResult() const { return lastResult_; }

    const ColumnAnimator& animator(int col) const { return *animators_[col]; }
    int columnCount() const { return static_cast<int>(animators_.size()); }

    std::uint64_t spinsCompleted() const { return spinsCompleted_; }

private:
    GridModel& model_;
    ResultGenerator& generator_;
    PauseController& pause_;
    WinEvaluator evaluator_;

    std::vector<std::unique_ptr<ColumnAnimator>> animators_;
    std::unique_ptr<SpinSession> session_;
    std::vector<SpinListener*> listeners_;
    std::function<bool()> stakeCheck_;
    std::optional<WinResult> lastResult_;
    std::uint64_t spinsCompleted_{0};
    bool tornDown_{false};

    std::optional<std::string> checkConfiguration(const SpinTiming& timing) const;

    void commitColumn(int col);
    void resolve();

    void notify(const std::function<void(SpinListener&)>& fn);
};
