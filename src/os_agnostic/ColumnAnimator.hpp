/**
 * @file ColumnAnimator.hpp
 * @brief Scroll controller of one reel column.
 */

#pragma once

#include "FrameTime.hpp"
#include "Grid.hpp"
#include "PauseController.hpp"

#include <future>

enum class AnimatorState { Idle, Running, Completing };

/**
 * @brief Advances one column's wrap-around scroll offset every frame until its duration elapses.
 *
 * The host calls step() once per rendered frame. Movement is scaled by the
 * frame delta over a reference frame interval, so 30, 60 and 144 Hz hosts
 * scroll the same distance in the same wall time. Completion is measured in
 * active (non-paused) time only; see PauseController.
 *
 * Idle -> Running on start(); Running -> Completing -> Idle inside the step()
 * that reaches the duration, which also resolves completion().
 */
class ColumnAnimator : public Pausable {
public:
    ColumnAnimator(ReelColumn& column, PauseController& pause,
                   double cycleDistance, Millis referenceFrame);
    ~ColumnAnimator() override;

    ColumnAnimator(const ColumnAnimator&) = delete;
    ColumnAnimator& operator=(const ColumnAnimator&) = delete;

    /**
     * @brief Begin scrolling.
     * @return false when already running, or for a negative duration or speed.
     * A zero duration completes on the next step().
     */
    bool start(Millis duration, double scrollSpeed, TimePoint now);

    // One frame of animation. No-op unless Running and not paused.
    void step(TimePoint now);

    // Back to Idle without resolving; the pending completion reports broken_promise.
    void reset();

    // Resolved once per start(), when the column stops.
    std::shared_future<void> completion() const { return completion_; }

    AnimatorState state() const { return state_; }
    bool isRunning() const { return state_ == AnimatorState::Running; }

    Millis duration() const { return duration_; }

    // Active time consumed so far; frozen while paused.
    Millis activeElapsed(TimePoint now) const;

    // Active time measured in the step that completed the last run.
    Millis completedElapsed() const { return completedElapsed_; }

    int columnIndex() const { return column_.index; }

    void onPause(TimePoint now) override;
    void onResume(TimePoint now) override;

private:
    ReelColumn& column_;
    PauseController& pause_;
    const double cycleDistance_;
    const Millis referenceFrame_;

    AnimatorState state_{AnimatorState::Idle};
    Millis duration_{0.0};
    double scrollSpeed_{0.0};

    TimePoint startTime_{};
    TimePoint lastFrame_{};
    Millis consumedAtPause_{0.0};
    Millis completedElapsed_{0.0};

    std::promise<void> done_;
    std::shared_future<void> completion_;

    void complete(Millis elapsed);
};
