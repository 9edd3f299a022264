/**
 * @file ColumnAnimator.cpp
 * @brief Scroll controller of one reel column.
 */

#include "ColumnAnimator.hpp"
#include "Log.hpp"

#include <algorithm>
#include <cmath>

ColumnAnimator::ColumnAnimator(ReelColumn& column, PauseController& pause,
                               double cycleDistance, Millis referenceFrame)
    : column_(column),
      pause_(pause),
      cycleDistance_(cycleDistance),
      referenceFrame_(referenceFrame.count() > 0.0 ? referenceFrame : Millis{16.67}) {}

ColumnAnimator::~ColumnAnimator() {
    pause_.untrack(this);
}

bool ColumnAnimator::start(Millis duration, double scrollSpeed, TimePoint now) {
    if (state_ != AnimatorState::Idle) {
        Log::warn("column " + std::to_string(column_.index) + ": start rejected, already running");
        return false;
    }
    if (duration.count() < 0.0 || scrollSpeed < 0.0) {
        Log::warn("column " + std::to_string(column_.index) + ": start rejected, negative duration or speed");
        return false;
    }

    duration_ = duration;
    scrollSpeed_ = scrollSpeed;
    startTime_ = now;
    lastFrame_ = now;
    consumedAtPause_ = Millis{0.0};

    column_.scrollOffset = 0.0;
    column_.renderedOffset = column_.restOffset;
    column_.cueActive = true;

    done_ = std::promise<void>();
    completion_ = done_.get_future().share();

    state_ = AnimatorState::Running;
    pause_.track(this);
    return true;
}

void ColumnAnimator::step(TimePoint now) {
    if (state_ != AnimatorState::Running) return;
    if (pause_.isPaused()) return;

    // 1.0 == one reference frame
    const double delta = std::max(0.0, Millis(now - lastFrame_) / referenceFrame_);
    lastFrame_ = now;

    column_.scrollOffset += scrollSpeed_ * delta;
    const double wrapped = cycleDistance_ > 0.0 ? std::fmod(column_.scrollOffset, cycleDistance_) : 0.0;
    column_.renderedOffset = column_.restOffset + wrapped;

    const Millis elapsed = now - startTime_;
    if (elapsed >= duration_) complete(elapsed);
}

void ColumnAnimator::complete(Millis elapsed) {
    state_ = AnimatorState::Completing;

    column_.renderedOffset = column_.restOffset;
    column_.cueActive = false;
    completedElapsed_ = elapsed;

    pause_.untrack(this);
    state_ = AnimatorState::Idle;
    done_.set_value();
}

void ColumnAnimator::reset() {
    pause_.untrack(this);
    if (state_ != AnimatorState::Idle) {
        column_.renderedOffset = column_.restOffset;
        column_.cueActive = false;
        done_ = std::promise<void>();
    }
    state_ = AnimatorState::Idle;
}

Millis ColumnAnimator::activeElapsed(TimePoint now) const {
    if (state_ != AnimatorState::Running) return completedElapsed_;
    if (pause_.isPaused()) return consumedAtPause_;
    return now - startTime_;
}

void ColumnAnimator::onPause(TimePoint now) {
    consumedAtPause_ = std::max(Millis{0.0}, Millis(now - startTime_));
}

void ColumnAnimator::onResume(TimePoint now) {
    startTime_ = now - std::chrono::duration_cast<FrameClock::duration>(consumedAtPause_);
    lastFrame_ = now;
}
