/**
 * @file PauseController.cpp
 * @brief Freezes and unfreezes the clock of every running timed animation.
 */

#include "PauseController.hpp"
#include "Log.hpp"

#include <algorithm>
#include <exception>

void PauseController::pause(TimePoint now) {
    if (paused_) return;

    paused_ = true;
    pausedAt_ = now;
    for (Pausable* p : tracked_) p->onPause(now);

    Log::info("pause: engine paused, " + std::to_string(tracked_.size()) + " animation(s) frozen");
    runCallbacks(pauseCallbacks_, "pause");
}

void PauseController::resume(TimePoint now) {
    if (!paused_) return;

    paused_ = false;
    lastPauseLength_ = std::chrono::duration_cast<Millis>(now - pausedAt_);
    for (Pausable* p : tracked_) p->onResume(now);

    Log::info("pause: resumed after " + std::to_string(lastPauseLength_.count()) + " ms");
    runCallbacks(resumeCallbacks_, "resume");
}

void PauseController::track(Pausable* p) {
    if (!p) return;
    if (std::find(tracked_.begin(), tracked_.end(), p) == tracked_.end()) {
        tracked_.push_back(p);
    }
}

void PauseController::untrack(Pausable* p) {
    tracked_.erase(std::remove(tracked_.begin(), tracked_.end(), p), tracked_.end());
}

void PauseController::runCallbacks(const std::vector<std::function<void()>>& cbs, const char* what) {
    for (const auto& cb : cbs) {
        try {
            if (cb) cb();
        } catch (const std::exception& e) {
            Log::error(std::string("pause: error in ") + what + " callback: " + e.what());
        }
    }
}
