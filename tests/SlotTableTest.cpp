#include "SlotTable.hpp"
#include "TestClock.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

SlotConfig tableConfig() {
    SlotConfig config;
    config.seed = 2024u;
    config.speed = AnimationSpeed::Fast;
    return config;
}

struct Rig {
    SlotConfig config = tableConfig();
    SlotMachine machine{config};
    Wallet wallet;
    SlotTable table{machine, wallet};

    explicit Rig(int credits = 1000) : wallet(credits, 10, 1, 100) {
        machine.init(SymbolAtlas{config.glyphs});
    }

    // fast preset: 800 ms plus four 200 ms staggers
    void finishSpin(double fromMs) {
        for (double t = fromMs + 10.0; t <= fromMs + 1700.0; t += 10.0) machine.tick(at(t));
    }
};

// Settles every result the way the console does, and notes the stake it saw.
struct Settler : SpinListener {
    SlotTable& table;
    std::vector<int> stakes;
    std::vector<WinTier> tiers;

    explicit Settler(SlotTable& t) : table(t) {}

    void onSpinResolved(const WinResult& r) override {
        stakes.push_back(table.stakedBet());
        tiers.push_back(table.settle(r));
    }
};

WinResult payout(int credits) {
    WinResult r;
    r.payout = credits;
    return r;
}

}  // namespace

TEST(SlotTableTest, SpinDebitsOnlyWhenAccepted) {
    Rig rig(15);
    ASSERT_TRUE(rig.machine.isReady());

    EXPECT_EQ(rig.table.spin(at(0)), SpinStatus::Accepted);
    EXPECT_EQ(rig.wallet.credits(), 5);
    EXPECT_EQ(rig.table.stakedBet(), 10);

    EXPECT_EQ(rig.table.spin(at(5)), SpinStatus::Busy);
    EXPECT_EQ(rig.wallet.credits(), 5);

    rig.finishSpin(0);
    EXPECT_FALSE(rig.machine.coordinator().isSpinning());
    EXPECT_EQ(rig.table.spin(at(2000)), SpinStatus::InsufficientStake);
    EXPECT_EQ(rig.wallet.credits(), 5);
}

TEST(SlotTableTest, BetIsLockedWhileTheReelsSpin) {
    Rig rig;
    ASSERT_EQ(rig.table.spin(at(0)), SpinStatus::Accepted);

    EXPECT_EQ(rig.table.setBet(50), BetChange::Locked);
    EXPECT_EQ(rig.wallet.bet(), 10);

    rig.finishSpin(0);
    EXPECT_EQ(rig.table.setBet(50), BetChange::Changed);
    EXPECT_EQ(rig.wallet.bet(), 50);
    EXPECT_EQ(rig.table.setBet(500), BetChange::OutOfRange);
    EXPECT_EQ(rig.wallet.bet(), 50);
}

TEST(SlotTableTest, SettleClassifiesAgainstTheStakedBet) {
    Rig rig;
    ASSERT_EQ(rig.table.spin(at(0)), SpinStatus::Accepted);
    ASSERT_EQ(rig.wallet.credits(), 990);

    // a bigger bet mid-spin would turn a 10x win into no tier at all
    EXPECT_EQ(rig.table.setBet(100), BetChange::Locked);

    EXPECT_EQ(rig.table.settle(payout(100)), WinTier::Big);
    EXPECT_EQ(rig.wallet.credits(), 1090);
}

TEST(SlotTableTest, InstantSpinSettlesWithItsOwnBet) {
    Rig rig;
    Settler settler(rig.table);
    rig.machine.coordinator().addListener(&settler);
    rig.machine.setInstant(true);

    ASSERT_EQ(rig.table.spin(at(0)), SpinStatus::Accepted);
    ASSERT_EQ(rig.table.setBet(40), BetChange::Changed);
    ASSERT_EQ(rig.table.spin(at(10)), SpinStatus::Accepted);

    ASSERT_EQ(settler.stakes.size(), 2u);
    EXPECT_EQ(settler.stakes[0], 10);
    EXPECT_EQ(settler.stakes[1], 40);

    rig.machine.coordinator().removeListener(&settler);
}

TEST(SlotTableTest, RejectedSpinKeepsThePreviousStake) {
    Rig rig(15);
    ASSERT_EQ(rig.table.spin(at(0)), SpinStatus::Accepted);
    rig.finishSpin(0);

    ASSERT_EQ(rig.table.setBet(20), BetChange::Changed);
    EXPECT_EQ(rig.table.spin(at(2000)), SpinStatus::InsufficientStake);
    EXPECT_EQ(rig.table.stakedBet(), 10);
}

TEST(SlotTableTest, ReloadKeepsSettingsTheFileDoesNotMention) {
    Rig rig;
    rig.machine.setSpeed(AnimationSpeed::VeryFast);
    rig.machine.setInstant(true);

    std::vector<std::string> problems;
    EXPECT_TRUE(rig.table.reload("bet = 20\n", problems));
    EXPECT_TRUE(problems.empty());

    EXPECT_EQ(rig.machine.config().speed, AnimationSpeed::VeryFast);
    EXPECT_TRUE(rig.machine.config().instant);
    EXPECT_EQ(rig.wallet.bet(), 20);
}

TEST(SlotTableTest, ReloadAppliesEveryRuntimeKey) {
    Rig rig;
    std::vector<std::string> problems;
    EXPECT_TRUE(rig.table.reload("# tuned\nspeed = very-slow\ninstant = on\nbet = 5\n", problems));
    EXPECT_EQ(rig.machine.config().speed, AnimationSpeed::VerySlow);
    EXPECT_TRUE(rig.machine.config().instant);
    EXPECT_EQ(rig.wallet.bet(), 5);
}

TEST(SlotTableTest, ReloadWithAnOutOfRangeBetAppliesNothing) {
    Rig rig;
    std::vector<std::string> problems;
    EXPECT_FALSE(rig.table.reload("speed = slow\nbet = 500\n", problems));
    ASSERT_FALSE(problems.empty());

    EXPECT_EQ(rig.machine.config().speed, AnimationSpeed::Fast);
    EXPECT_EQ(rig.wallet.bet(), 10);
}

TEST(SlotTableTest, ReloadDuringASpinReportsTheLockedBet) {
    Rig rig;
    ASSERT_EQ(rig.table.spin(at(0)), SpinStatus::Accepted);

    std::vector<std::string> problems;
    EXPECT_FALSE(rig.table.reload("bet = 20\nspeed = slow\n", problems));
    ASSERT_EQ(problems.size(), 1u);
    EXPECT_NE(problems[0].find("locked"), std::string::npos);

    EXPECT_EQ(rig.wallet.bet(), 10);
    EXPECT_EQ(rig.machine.config().speed, AnimationSpeed::Slow);
}

TEST(SlotTableTest, ReloadIgnoresStartupOnlyKeys) {
    Rig rig;
    std::vector<std::string> problems;
    EXPECT_FALSE(rig.table.reload("rows = 4\ninstant = on\n", problems));
    ASSERT_EQ(problems.size(), 1u);

    EXPECT_EQ(rig.machine.config().rows, 3);
    EXPECT_EQ(rig.machine.grid().rows(), 3);
    EXPECT_TRUE(rig.machine.config().instant);
}

TEST(SlotTableTest, ReloadReportsBadLinesAndAppliesTheRest) {
    Rig rig;
    std::vector<std::string> problems;
    EXPECT_FALSE(rig.table.reload("speed = ludicrous\nbet = 30\n", problems));
    ASSERT_EQ(problems.size(), 1u);
    EXPECT_EQ(problems[0].rfind("line 1:", 0), 0u);

    EXPECT_EQ(rig.machine.config().speed, AnimationSpeed::Fast);
    EXPECT_EQ(rig.wallet.bet(), 30);
}
