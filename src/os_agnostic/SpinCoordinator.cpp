/**
 * @file SpinCoordinator.cpp
 * @brief Runs one spin across all reel columns, from committed outcome to win result.
 */

#include "SpinCoordinator.hpp"
#include "Log.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <sstream>

const char* toString(SpinStatus status) {
    switch (status) {
        case SpinStatus::Accepted:          return "accepted";
        case SpinStatus::Busy:              return "busy";
        case SpinStatus::InsufficientStake: return "insufficient stake";
        case SpinStatus::InvalidConfig:     return "invalid configuration";
        case SpinStatus::NotReady:          return "not ready";
    }
    return "unknown";
}

int SpinSession::stoppedCount() const {
    return static_cast<int>(std::count(stopped.begin(), stopped.end(), true));
}

SpinCoordinator::SpinCoordinator(GridModel& model, ResultGenerator& generator, PauseController& pause,
                                 WinEvaluator evaluator, Millis referenceFrame)
    : model_(model), generator_(generator), pause_(pause), evaluator_(evaluator) {
    animators_.reserve(model_.cols());
    for (int c = 0; c < model_.cols(); ++c) {
        animators_.push_back(std::make_unique<ColumnAnimator>(
            model_.column(c), pause_, model_.cycleDistance(), referenceFrame));
    }
}

void SpinCoordinator::addListener(SpinListener* listener) {
    if (listener && std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(listener);
    }
}

void SpinCoordinator::removeListener(SpinListener* listener) {
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

std::optional<std::string> SpinCoordinator::checkConfiguration(const SpinTiming& timing) const {
    if (generator_.rows() != model_.rows() || generator_.cols() != model_.cols()) {
        std::ostringstream os;
        os << "result grid is " << generator_.rows() << "x" << generator_.cols()
           << " but the machine is " << model_.rows() << "x" << model_.cols();
        return os.str();
    }
    if (static_cast<int>(animators_.size()) != model_.cols()) {
        return "column animator count does not match the grid";
    }
    if (timing.instant) return std::nullopt;

    if (timing.baseDuration.count() <= 0.0) return "spin duration must be positive";
    if (timing.stagger.count() < 0.0)       return "column stagger must not be negative";
    if (timing.scrollSpeed < 0.0)           return "scroll speed must not be negative";
    return std::nullopt;
}

SpinTicket SpinCoordinator::spin(const SpinTiming& timing, TimePoint now) {
    SpinTicket ticket;

    // >>> REJECTIONS (nothing is mutated on any of these paths)

    if (tornDown_ || !model_.isBound()) {
        ticket.status = SpinStatus::NotReady;
        Log::warn("spin: rejected, machine not ready");
        return ticket;
    }
    if (session_) {
        ticket.status = SpinStatus::Busy;
        Log::info("spin: rejected, a spin is already in flight");
        return ticket;
    }
    if (auto problem = checkConfiguration(timing)) {
        ticket.status = SpinStatus::InvalidConfig;
        Log::error("spin: rejected, " + *problem);
        return ticket;
    }
    if (stakeCheck_ && !stakeCheck_()) {
        ticket.status = SpinStatus::InsufficientStake;
        Log::info("spin: rejected, insufficient stake");
        return ticket;
    }

    // >>> COMMIT THE OUTCOME BEFORE ANY FRAME RUNS

    auto session = std::make_unique<SpinSession>();
    session->committed = generator_.generate();
    session->stopped.assign(animators_.size(), false);
    session->startedAt = now;
    session->instant = timing.instant;

    if (!timing.instant) {
        for (std::size_t c = 0; c < animators_.size(); ++c) {
            if (!animators_[c]->start(timing.durationFor(static_cast<int>(c)), timing.scrollSpeed, now)) {
                for (auto& a : animators_) a->reset();
                ticket.status = SpinStatus::InvalidConfig;
                Log::error("spin: rejected, column " + std::to_string(c) + " could not start");
                return ticket;
            }
            session->completions.push_back(animators_[c]->completion());
        }
    }

    ticket.result = session->promise.get_future();
    ticket.status = SpinStatus::Accepted;
    session_ = std::move(session);

    Log::info(std::string("spin: accepted") + (timing.instant ? " (instant)" : "") +
              (pause_.isPaused() ? " while paused" : ""));
    notify([](SpinListener& l) { l.onSpinStarted(); });

    if (timing.instant) {
        for (int c = 0; c < static_cast<int>(animators_.size()); ++c) commitColumn(c);
        resolve();
    }
    return ticket;
}

void SpinCoordinator::tick(TimePoint now) {
    if (tornDown_ || !session_) return;

    for (auto& a : animators_) a->step(now);

    // Join: commit whichever columns finished, always in column order.
    for (std::size_t c = 0; c < animators_.size(); ++c) {
        if (!session_->stopped[c] &&
            session_->completions[c].wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            commitColumn(static_cast<int>(c));
            if (!session_) return;  // torn down by a listener
        }
    }

    if (session_->allStopped()) resolve();
}

void SpinCoordinator::commitColumn(int col) {
    if (!session_) return;
    if (!model_.commitColumn(col, session_->committed)) {
        Log::error("spin: column " + std::to_string(col) + " could not be committed");
        return;
    }
    session_->stopped[col] = true;

    Log::debug("spin: column " + std::to_string(col + 1) + " stopped");
    notify([col](SpinListener& l) { l.onColumnStopped(col + 1); });
}

void SpinCoordinator::resolve() {
    if (!session_) return;
    WinResult result = evaluator_.evaluate(model_.cells());

    // The session ends before anyone hears about it, so a listener may spin again.
    std::unique_ptr<SpinSession> finished = std::move(session_);
    lastResult_ = result;
    ++spinsCompleted_;

    finished->promise.set_value(result);

    Log::info("spin: resolved, payout " + std::to_string(result.payout) +
              (result.drivingSymbol ? ", symbol " + std::to_string(*result.drivingSymbol) : std::string{}));
    notify([&result](SpinListener& l) { l.onSpinResolved(result); });
}

void SpinCoordinator::teardown() {
    if (tornDown_) return;
    tornDown_ = true;

    for (auto& a : animators_) a->reset();
    session_.reset();
    Log::info("spin: torn down");
}

void SpinCoordinator::notify(const std::function<void(SpinListener&)>& fn) {
    // Copy: a listener may add or remove listeners while being notified.
    const std::vector<SpinListener*> listeners = listeners_;
    for (SpinListener* l : listeners) {
        try {
            fn(*l);
        } catch (const std::exception& e) {
            Log::error(std::string("spin: listener error: ") + e.what());
        }
    }
}
