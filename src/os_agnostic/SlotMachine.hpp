/**
 * @file SlotMachine.hpp
 * @brief One reel machine: grid, outcome source, pause clock and spin coordinator.
 */

#pragma once

#include "FrameTime.hpp"
#include "Grid.hpp"
#include "PauseController.hpp"
#include "ResultGenerator.hpp"
#include "SlotConfig.hpp"
#include "SpinCoordinator.hpp"
#include "WinEvaluator.hpp"

/**
 * @brief Owns the spin engine and is driven by the host frame loop.
 *
 * Everything here runs on the thread that calls tick(); other threads must
 * hand requests to that thread instead of calling in directly.
 */
class SlotMachine {
public:
    explicit SlotMachine(const SlotConfig& config);
    ~SlotMachine();

    SlotMachine(const SlotMachine&) = delete;
    SlotMachine& operator=(const SlotMachine&) = delete;

    /**
     * @brief Bind the symbol handles and deal the opening grid.
     * @return false on an invalid config or an atlas that cannot cover every symbol.
     */
    bool init(const SymbolAtlas& atlas);
    bool isReady() const { return ready_; }

    // Spin with the configured speed preset and instant setting.
    SpinTicket spin(TimePoint now);
    SpinTicket spin(const SpinTiming& timing, TimePoint now);

    void tick(TimePoint now) { coordinator_.tick(now); }

    void pause(TimePoint now)  { pause_.pause(now); }
    void resume(TimePoint now) { pause_.resume(now); }
    bool isPaused() const { return pause_.isPaused(); }

    void teardown();

    // >>> RUNTIME SETTINGS

    void setSpeed(AnimationSpeed speed) { config_.speed = speed; }
    void setInstant(bool instant) { config_.instant = instant; }
    const SlotConfig& config() const { return config_; }

    // >>> PARTS

    GridModel& grid() { return grid_; }
    const GridModel& grid() const { return grid_; }
    SpinCoordinator& coordinator() { return coordinator_; }
    const SpinCoordinator& coordinator() const { return coordinator_; }
    PauseController& pauseController() { return pause_; }

private:
    SlotConfig config_;
    PauseController pause_;
    GridModel grid_;
    ResultGenerator generator_;
    SpinCoordinator coordinator_;
    bool ready_{false};

    static ResultGenerator makeGenerator(const SlotConfig& config);
};
