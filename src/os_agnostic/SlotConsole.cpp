/**
 * @file SlotConsole.cpp
 * @brief Mainly handles the starting and shutting down of all threads.
 */

#include "SlotConsole.hpp"
#include "Log.hpp"
#include <chrono>

/**
 * @brief Wires up internal handlers and builds the console.
 *
 * Configures the machine, wallet, auto-spin, sound, command, keyboard and display,
 * and uses callback binding and handler injection to connect them.
 */
SlotConsole::SlotConsole(const SlotConfig& cfg):
    ctx(),
    config(cfg),
    machine(cfg),
    wallet(cfg.initialCredits, cfg.bet, cfg.minBet, cfg.maxBet),
    table(machine, wallet),
    autoSpinner(table),
    audio(cfg),
    display(ctx, table, cfg.cellWidth, cfg.frameIntervalMs),
    keyboard(ctx),
    command(ctx),
    fileReader(ctx)
{
    // Spin milestones feed the screen and the speakers.
    machine.coordinator().addListener(&display);
    machine.coordinator().addListener(&audio);

    // The table already holds the stake check; the run reports its end on the status line.
    autoSpinner.setOnFinished([this](const std::string& reason) {
        ctx.setStatus("Auto-spin ended (" + reason + ").");
    });
    display.addAutoSpinner(&autoSpinner);

    // Sound follows the pause state.
    machine.pauseController().onPause([this] { audio.pauseAll(); });
    machine.pauseController().onResume([this] { audio.resumeAll(); });

    command.addSlotTable(&table);
    command.addAutoSpinner(&autoSpinner);
    command.addFileReaderHandler(&fileReader);

    // Commands entered by the user are given to the command processor via the keyboard.
    keyboard.setSink([this](std::string cmd) {
        command.enqueue(std::move(cmd));
    });
}

SlotConsole::~SlotConsole() {
    machine.coordinator().removeListener(&audio);
    machine.coordinator().removeListener(&display);
}

bool SlotConsole::init() {
    if (!machine.init(SymbolAtlas{config.glyphs})) {
        Log::error("console: machine failed to initialize");
        return false;
    }
    ctx.setFrameHeight(display.frameHeight());
    audio.ping();
    return true;
}

/**
 * @brief manages the lifecycle until shutdown, launches all worker threads.
 *
 * Launches a supervisor thread along with the handlers for display, keyboard input, and commands.
 * This is idle until shutdown is requested, after waiting for all threads to reach the init barrier.
 */
void SlotConsole::run() {
    // Launch core handler threads
    threads.emplace_back(std::ref(display));
    threads.emplace_back(std::ref(keyboard));
    threads.emplace_back(std::ref(command));

    // A fourth participant in the barrier: the supervisor thread
    threads.emplace_back([this] {
        // >>> JOIN INIT PHASE
        ctx.phase_barrier.arrive_and_wait();

        // Supervisor loop: spin until exit is requested
        while (!ctx.exitRequested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        // Ctrl+C leaves the command thread asleep on its queue
        command.wake();

        // Count down to let others know we're done
        ctx.stop_latch.count_down();
    });

    // Wait until all threads finish gracefully
    ctx.stop_latch.wait();
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
}
