/**
 * @file PauseController.hpp
 * @brief Freezes and unfreezes the clock of every running timed animation.
 */

#pragma once

#include "FrameTime.hpp"

#include <functional>
#include <vector>

/**
 * @brief Anything that measures elapsed time and must stand still while paused.
 */
class Pausable {
public:
    virtual ~Pausable() = default;

    // Save the time consumed so far.
    virtual void onPause(TimePoint now) = 0;

    // Re-base the clock so consumed time continues from the saved value.
    virtual void onResume(TimePoint now) = 0;
};

/**
 * @brief The pause state every animation reads.
 *
 * Owned by the machine and injected into animators and the coordinator.
 * pause() and resume() are idempotent. Neither stops frame polling; running
 * animators keep being stepped and simply do nothing while isPaused().
 */
class PauseController {
public:
    void pause(TimePoint now);
    void resume(TimePoint now);

    bool isPaused() const { return paused_; }

    // Wall-clock length of the last completed pause.
    Millis lastPauseLength() const { return lastPauseLength_; }

    // >>> RUNNING ANIMATIONS

    void track(Pausable* p);
    void untrack(Pausable* p);
    std::size_t trackedCount() const { return tracked_.size(); }

    // >>> COLLABORATOR HOOKS (music, effects)

    void onPause(std::function<void()> cb)  { pauseCallbacks_.push_back(std::move(cb)); }
    void onResume(std::function<void()> cb) { resumeCallbacks_.push_back(std::move(cb)); }

private:
    bool paused_{false};
    TimePoint pausedAt_{};
    Millis lastPauseLength_{0.0};

    std::vector<Pausable*> tracked_;
    std::vector<std::function<void()>> pauseCallbacks_;
    std::vector<std::function<void()>> resumeCallbacks_;

    static void runCallbacks(const std::vector<std::function<void()>>& cbs, const char* what);
};
