#include "SlotMachine.hpp"
#include "TestClock.hpp"

#include <gtest/gtest.h>

#include <chrono>

namespace {

SlotConfig seededConfig(std::uint32_t seed) {
    SlotConfig config;
    config.seed = seed;
    config.speed = AnimationSpeed::Fast;
    return config;
}

}  // namespace

TEST(SlotMachineTest, SpinBeforeInitIsNotReady) {
    SlotMachine machine(seededConfig(1u));
    SpinTicket ticket = machine.spin(at(0));
    EXPECT_EQ(ticket.status, SpinStatus::NotReady);
    EXPECT_FALSE(machine.isReady());
}

TEST(SlotMachineTest, InitRejectsAShortAtlas) {
    SlotMachine machine(seededConfig(1u));
    EXPECT_FALSE(machine.init(SymbolAtlas{{"KNIGHT", "WIZARD"}}));
    EXPECT_FALSE(machine.isReady());
}

TEST(SlotMachineTest, InitRejectsAnInvalidConfig) {
    SlotConfig config = seededConfig(1u);
    config.rowHeight = -1.0;
    SlotMachine machine(config);
    EXPECT_FALSE(machine.init(SymbolAtlas{config.glyphs}));
}

TEST(SlotMachineTest, SeededMachinesPlayTheSameGame) {
    SlotConfig config = seededConfig(555u);
    SlotMachine a(config);
    SlotMachine b(config);
    ASSERT_TRUE(a.init(SymbolAtlas{config.glyphs}));
    ASSERT_TRUE(b.init(SymbolAtlas{config.glyphs}));
    EXPECT_EQ(a.grid().cells(), b.grid().cells());

    SpinTicket ta = a.spin(at(0));
    SpinTicket tb = b.spin(at(0));
    ASSERT_TRUE(ta.accepted());
    ASSERT_TRUE(tb.accepted());

    // fast preset: 800 ms plus four 200 ms staggers
    for (int t = 16; t <= 1700; t += 16) {
        a.tick(at(t));
        b.tick(at(t));
    }
    EXPECT_EQ(ta.result.get(), tb.result.get());
    EXPECT_EQ(a.grid().cells(), b.grid().cells());
}

TEST(SlotMachineTest, InstantSettingSkipsTheAnimation) {
    SlotConfig config = seededConfig(9u);
    SlotMachine machine(config);
    ASSERT_TRUE(machine.init(SymbolAtlas{config.glyphs}));

    machine.setInstant(true);
    SpinTicket ticket = machine.spin(at(0));
    ASSERT_TRUE(ticket.accepted());
    EXPECT_EQ(ticket.result.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_FALSE(machine.coordinator().isSpinning());
}

TEST(SlotMachineTest, SpeedSettingChangesTheNextSpin) {
    SlotConfig config = seededConfig(9u);
    SlotMachine machine(config);
    ASSERT_TRUE(machine.init(SymbolAtlas{config.glyphs}));

    machine.setSpeed(AnimationSpeed::Slow);
    ASSERT_TRUE(machine.spin(at(0)).accepted());
    EXPECT_DOUBLE_EQ(machine.coordinator().animator(0).duration().count(), 2500.0);
    EXPECT_DOUBLE_EQ(machine.coordinator().animator(4).duration().count(), 3300.0);
}

TEST(SlotMachineTest, PauseFreezesAndTeardownStopsEverything) {
    SlotConfig config = seededConfig(13u);
    SlotMachine machine(config);
    ASSERT_TRUE(machine.init(SymbolAtlas{config.glyphs}));

    SpinTicket ticket = machine.spin(at(0));
    ASSERT_TRUE(ticket.accepted());
    machine.pause(at(100));
    EXPECT_TRUE(machine.isPaused());
    machine.tick(at(5000));
    EXPECT_EQ(machine.coordinator().session()->stoppedCount(), 0);

    machine.teardown();
    EXPECT_FALSE(machine.isReady());
    EXPECT_THROW(ticket.result.get(), std::future_error);
    EXPECT_EQ(machine.spin(at(6000)).status, SpinStatus::NotReady);
}
