/**
 * @file SlotMachine.cpp
 * @brief One reel machine: grid, outcome source, pause clock and spin coordinator.
 */

#include "SlotMachine.hpp"
#include "Log.hpp"

ResultGenerator SlotMachine::makeGenerator(const SlotConfig& config) {
    if (config.seed != 0) {
        return ResultGenerator(config.rows, config.columns, config.symbolCount, config.seed);
    }
    return ResultGenerator(config.rows, config.columns, config.symbolCount);
}

SlotMachine::SlotMachine(const SlotConfig& config)
    : config_(config),
      pause_(),
      grid_(config.rows, config.columns, config.rowHeight),
      generator_(makeGenerator(config)),
      coordinator_(grid_, generator_, pause_,
                   WinEvaluator(config.creditsPerMatch, config.minRun),
                   config.referenceFrame) {}

SlotMachine::~SlotMachine() {
    coordinator_.teardown();
}

bool SlotMachine::init(const SymbolAtlas& atlas) {
    if (auto problem = config_.validate()) {
        Log::error("machine: invalid config: " + *problem);
        return false;
    }
    if (!grid_.bind(atlas, config_.symbolCount)) {
        Log::error("machine: symbol handles unavailable, cannot start");
        return false;
    }
    if (!grid_.initialize(generator_.generate())) return false;

    ready_ = true;
    Log::info("machine: ready, " + std::to_string(config_.rows) + "x" +
              std::to_string(config_.columns) + " with " + std::to_string(config_.symbolCount) + " symbols");
    return true;
}

SpinTicket SlotMachine::spin(TimePoint now) {
    return spin(config_.timing(), now);
}

SpinTicket SlotMachine::spin(const SpinTiming& timing, TimePoint now) {
    if (!ready_) {
        Log::warn("machine: spin before init");
        return SpinTicket{};
    }
    return coordinator_.spin(timing, now);
}

void SlotMachine::teardown() {
    coordinator_.teardown();
    ready_ = false;
}
