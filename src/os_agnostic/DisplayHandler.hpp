/**
 * @file DisplayHandler.hpp
 * @brief Runs the frame loop: engine requests, engine tick, reel frame.
*/
#pragma once

#include "AutoSpinner.hpp"
#include "Context.hpp"
#include "HighlightLayer.hpp"
#include "ReelRenderer.hpp"
#include "SlotMachine.hpp"
#include "SlotTable.hpp"
#include "SpinCoordinator.hpp"

#include <string>
#include <vector>

/**
 * @brief Owns the frame thread, the only thread that touches the machine.
 *
 * Every frame it drains the engine mailbox, ticks the machine and repaints
 * the reel window above the prompt. It also listens to the spin coordinator
 * to keep the status line, the win highlights and the payout in step with
 * each spin, and advances the auto-spin run after each tick.
 */
class DisplayHandler : public Handler, public SpinListener {
public:
    /**
     * @brief Create a DisplayHandler that is connected to the shared context.
     * @param c Shared SlotContext for state access and synchronization.
     * @param t Machine and wallet this thread drives.
     * @param cellWidth Width of one reel cell in characters.
     * @param frameIntervalMs Frame period of the loop.
    */
    DisplayHandler(SlotContext& c, SlotTable& t, int cellWidth, int frameIntervalMs);

    /**
     * @brief Auto-spin run ticked right after the machine each frame.
     * @param a AutoSpinner to drive (can be nullptr to detach).
     */
    void addAutoSpinner(AutoSpinner* a) { autoSpinner = a; }

    /**
    * @brief The main thread function that runs the frame loop.
    *
    * Waits for the other threads at the phase barrier, then loops until exit
    * is requested. Tears the machine down before leaving so no spin outlives
    * the loop.
    */
    void operator()();

    /** @brief Lines one frame takes on screen. */
    int frameHeight() const { return renderer.frameHeight(machine.grid()); }

    // >>> SPIN MILESTONES

    void onSpinStarted() override;
    void onColumnStopped(int columnNumber) override;
    void onSpinResolved(const WinResult& result) override;

private:
    SlotTable& table;
    SlotMachine& machine;
    AutoSpinner* autoSpinner;
    HighlightLayer highlights;
    ReelRenderer renderer;
    int frameIntervalMs;

    /**
     * @brief Paint the frame on the lines reserved above the prompt.
     * @param lines Output of ReelRenderer::buildFrame.
    */
    void paint(const std::vector<std::string>& lines);

    std::string statusLine();
};
