/**
 * @file DisplayHandler.cpp
 * @brief Runs the frame loop: engine requests, engine tick, reel frame.
 */

#include "DisplayHandler.hpp"
#include "Log.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <thread>

DisplayHandler::DisplayHandler(SlotContext& c, SlotTable& t, int cellWidth, int frameIntervalMs)
    : Handler(c),
      table(t),
      machine(t.machine()),
      autoSpinner(nullptr),
      highlights(static_cast<std::size_t>(machine.grid().rows()) * machine.grid().cols()),
      renderer(cellWidth),
      frameIntervalMs(frameIntervalMs < 1 ? 1 : frameIntervalMs) {}

/**
 * @brief Balance, bet, auto-spin and pause state in front of the shared status text.
 */
std::string DisplayHandler::statusLine() {
    const Wallet& wallet = table.wallet();
    std::string line = "Credits " + std::to_string(wallet.credits()) +
                       " | Bet " + std::to_string(wallet.bet());
    if (autoSpinner && autoSpinner->isActive()) {
        line += autoSpinner->isInfinite() ? std::string(" | AUTO")
                                          : " | AUTO " + std::to_string(autoSpinner->remaining()) + " left";
        if (autoSpinner->stopRequested()) line += " (stopping)";
    }
    if (machine.isPaused()) line += " | PAUSED";
    return line + " | " + ctx.getStatus();
}

/**
 * @brief Redraws the reel window on the H lines above the prompt anchor.
 *
 * If the prompt hasn't been drawn yet, the frame is skipped; the keyboard
 * handler reserves the lines when it places the prompt.
 */
void DisplayHandler::paint(const std::vector<std::string>& lines) {
    std::lock_guard<std::mutex> lock(ctx.coutMutex);
    if (!ctx.getHasPromptLine()) return;

    const int H = static_cast<int>(lines.size());
    for (int i = 0; i < H; ++i) {
        std::cout << "\x1b[u"                     // restore to prompt anchor
                  << "\x1b[" << (H - i) << "F"    // move up to this frame line
                  << "\r\x1b[2K"                  // clear it
                  << lines[i];
    }
    std::cout << "\x1b[u" << std::flush;          // back to the prompt
}

/**
 * @brief Main frame loop.
 *
 * Awaits the phase barrier, then per frame: run posted requests, tick the
 * machine (animators step even while paused; they just hold still), start
 * the next auto-spin round if one is due, repaint.
 */
void DisplayHandler::operator()() {
    // >>> JOIN INIT PHASE
    ctx.phase_barrier.arrive_and_wait();

    const auto period = std::chrono::milliseconds(frameIntervalMs);

    while (!ctx.exitRequested.load()) {
        const TimePoint now = FrameClock::now();

        for (auto& action : ctx.takeActions()) {
            try {
                if (action) action(machine, now);
            } catch (const std::exception& e) {
                Log::error(std::string("display: request failed: ") + e.what());
                ctx.setStatus(std::string("Request failed: ") + e.what());
            }
        }

        machine.tick(now);
        if (autoSpinner) autoSpinner->tick(now);
        paint(renderer.buildFrame(machine.grid(), highlights, statusLine()));

        std::this_thread::sleep_until(now + period);
    }

    // no per-frame work may outlive the loop
    if (autoSpinner) autoSpinner->cancel();
    machine.teardown();
    highlights.clear();

    // >>> THREAD EXIT
    ctx.stop_latch.count_down();  // signal this handler is finished
}

void DisplayHandler::onSpinStarted() {
    highlights.clear();
    ctx.setStatus("Spinning...");
}

void DisplayHandler::onColumnStopped(int columnNumber) {
    ctx.setStatus("Reel " + std::to_string(columnNumber) + " stopped.");
}

void DisplayHandler::onSpinResolved(const WinResult& result) {
    const WinTier tier = table.settle(result);
    if (!result.isWin()) {
        ctx.setStatus("No win. Try again!");
        return;
    }

    highlights.show(result, machine.grid());

    std::string msg = "WIN " + std::to_string(result.payout) + " credits";
    if (result.drivingSymbol) msg += " on " + machine.grid().glyph(*result.drivingSymbol);

    if (tier != WinTier::None) msg += std::string(" - ") + toString(tier) + "!";
    ctx.setStatus(msg);
}
