#include "SpinCoordinator.hpp"
#include "TestClock.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <string>
#include <vector>

namespace {

constexpr int kRows = 3;
constexpr int kCols = 5;
constexpr int kSymbols = 6;

SymbolAtlas atlas() {
    return SymbolAtlas{{"KNIGHT", "WIZARD", "ARCHER", "WARRIOR", "BARMAID", "KING"}};
}

SpinTiming quickTiming() {
    SpinTiming t;
    t.baseDuration = Millis{100.0};
    t.stagger = Millis{50.0};
    t.scrollSpeed = 10.0;
    return t;
}

template <typename F>
bool isReady(const F& f) {
    return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

// Records every milestone as a string, in the order heard.
struct Recorder : SpinListener {
    std::vector<std::string> events;

    void onSpinStarted() override { events.push_back("start"); }
    void onColumnStopped(int n) override { events.push_back("stop " + std::to_string(n)); }
    void onSpinResolved(const WinResult& r) override { events.push_back("resolved " + std::to_string(r.payout)); }
};

// A machine-sized rig with a seeded outcome source and a twin for predicting draws.
struct Rig {
    GridModel model{kRows, kCols, 185.0};
    ResultGenerator generator;
    ResultGenerator twin;
    PauseController pause;
    SpinCoordinator coordinator{model, generator, pause, WinEvaluator(), Millis{16.67}};
    Recorder recorder;

    explicit Rig(std::uint32_t seed, bool bind = true)
        : generator(kRows, kCols, kSymbols, seed), twin(kRows, kCols, kSymbols, seed) {
        if (bind) model.bind(atlas(), kSymbols);
        coordinator.addListener(&recorder);
    }

    // Ticks every `frame` ms from `fromMs` (exclusive) to `toMs` (inclusive).
    void run(double fromMs, double toMs, double frame = 10.0) {
        for (double t = fromMs + frame; t <= toMs + 1e-9; t += frame) coordinator.tick(at(t));
    }
};

}  // namespace

TEST(SpinCoordinatorTest, OutcomeIsCommittedBeforeTheFirstFrame) {
    Rig rig(2024u);
    const Grid expected = rig.twin.generate();

    SpinTicket ticket = rig.coordinator.spin(quickTiming(), at(0));
    ASSERT_TRUE(ticket.accepted());
    ASSERT_NE(rig.coordinator.session(), nullptr);
    EXPECT_EQ(rig.coordinator.session()->committed, expected);
    EXPECT_FALSE(isReady(ticket.result));

    rig.run(0, 1000);
    ASSERT_TRUE(isReady(ticket.result));
    EXPECT_EQ(rig.model.cells(), expected);
    EXPECT_EQ(ticket.result.get(), WinEvaluator().evaluate(expected));
}

TEST(SpinCoordinatorTest, DisplayedGridMatchesTheCommittedGridAcrossSeedsAndPauses) {
    for (std::uint32_t seed = 1; seed <= 25; ++seed) {
        Rig rig(seed);
        const Grid expected = rig.twin.generate();

        SpinTicket ticket = rig.coordinator.spin(quickTiming(), at(0));
        ASSERT_TRUE(ticket.accepted());

        rig.run(0, 30 + seed);
        rig.pause.pause(at(30 + seed));
        rig.run(30 + seed, 500);
        rig.pause.resume(at(500));
        rig.run(500, 2000);

        ASSERT_TRUE(isReady(ticket.result)) << "seed " << seed;
        const WinResult result = ticket.result.get();
        EXPECT_EQ(rig.model.cells(), expected) << "seed " << seed;
        EXPECT_EQ(result, WinEvaluator().evaluate(rig.model.cells())) << "seed " << seed;
    }
}

TEST(SpinCoordinatorTest, ColumnsStopLeftToRightAndResolveOnce) {
    Rig rig(7u);
    SpinTicket ticket = rig.coordinator.spin(quickTiming(), at(0));
    ASSERT_TRUE(ticket.accepted());
    rig.run(0, 1000);

    const WinResult result = ticket.result.get();
    const std::vector<std::string> expected{
        "start", "stop 1", "stop 2", "stop 3", "stop 4", "stop 5",
        "resolved " + std::to_string(result.payout)};
    EXPECT_EQ(rig.recorder.events, expected);
    EXPECT_EQ(rig.coordinator.spinsCompleted(), 1u);
    EXPECT_FALSE(rig.coordinator.isSpinning());
}

TEST(SpinCoordinatorTest, EachColumnStopsAfterItsStaggeredDuration) {
    Rig rig(11u);
    ASSERT_TRUE(rig.coordinator.spin(quickTiming(), at(0)).accepted());

    rig.run(0, 90);
    EXPECT_EQ(rig.coordinator.session()->stoppedCount(), 0);
    rig.coordinator.tick(at(100));
    EXPECT_EQ(rig.coordinator.session()->stoppedCount(), 1);
    rig.coordinator.tick(at(149));
    EXPECT_EQ(rig.coordinator.session()->stoppedCount(), 1);
    rig.coordinator.tick(at(150));
    EXPECT_EQ(rig.coordinator.session()->stoppedCount(), 2);
    rig.coordinator.tick(at(299));
    EXPECT_EQ(rig.coordinator.session()->stoppedCount(), 4);
    rig.coordinator.tick(at(300));
    EXPECT_FALSE(rig.coordinator.isSpinning());
}

TEST(SpinCoordinatorTest, UnstoppedColumnsKeepTheirPreviousCells) {
    Rig rig(5u);
    const Grid before = rig.model.cells();
    const Grid expected = rig.twin.generate();
    ASSERT_TRUE(rig.coordinator.spin(quickTiming(), at(0)).accepted());

    rig.run(0, 100);
    for (int r = 0; r < kRows; ++r) {
        EXPECT_EQ(rig.model.cells().at(r, 0), expected.at(r, 0));
        for (int c = 1; c < kCols; ++c) EXPECT_EQ(rig.model.cells().at(r, c), before.at(r, c));
    }
}

TEST(SpinCoordinatorTest, SecondSpinDuringASessionIsBusy) {
    Rig rig(3u);
    SpinTicket first = rig.coordinator.spin(quickTiming(), at(0));
    ASSERT_TRUE(first.accepted());
    const Grid committed = rig.coordinator.session()->committed;

    rig.run(0, 50);
    SpinTicket second = rig.coordinator.spin(quickTiming(), at(50));
    EXPECT_EQ(second.status, SpinStatus::Busy);
    EXPECT_FALSE(second.result.valid());
    EXPECT_EQ(rig.coordinator.session()->committed, committed);

    rig.run(50, 1000);
    EXPECT_TRUE(isReady(first.result));
    EXPECT_EQ(rig.model.cells(), committed);

    // a new spin is welcome once the last one resolved
    EXPECT_TRUE(rig.coordinator.spin(quickTiming(), at(1000)).accepted());
}

TEST(SpinCoordinatorTest, InstantSpinResolvesBeforeReturning) {
    Rig rig(99u);
    const Grid expected = rig.twin.generate();

    SpinTiming timing = quickTiming();
    timing.instant = true;
    SpinTicket ticket = rig.coordinator.spin(timing, at(0));
    ASSERT_TRUE(ticket.accepted());

    EXPECT_TRUE(isReady(ticket.result));
    EXPECT_FALSE(rig.coordinator.isSpinning());
    EXPECT_EQ(rig.model.cells(), expected);
    EXPECT_EQ(rig.recorder.events.size(), 7u);
    for (int c = 0; c < kCols; ++c) EXPECT_FALSE(rig.model.column(c).cueActive);
}

TEST(SpinCoordinatorTest, InstantAndAnimatedAgreeForTheSameSeed) {
    for (std::uint32_t seed : {1u, 17u, 314u, 4096u}) {
        Rig animated(seed);
        Rig instant(seed);

        SpinTicket a = animated.coordinator.spin(quickTiming(), at(0));
        animated.run(0, 1000);

        SpinTiming timing = quickTiming();
        timing.instant = true;
        SpinTicket b = instant.coordinator.spin(timing, at(0));

        ASSERT_TRUE(isReady(a.result));
        ASSERT_TRUE(isReady(b.result));
        EXPECT_EQ(a.result.get(), b.result.get()) << "seed " << seed;
        EXPECT_EQ(animated.model.cells(), instant.model.cells()) << "seed " << seed;
        EXPECT_EQ(animated.recorder.events, instant.recorder.events) << "seed " << seed;
    }
}

TEST(SpinCoordinatorTest, InstantIgnoresTheAnimationTiming) {
    Rig rig(8u);
    SpinTiming timing;
    timing.baseDuration = Millis{0.0};
    timing.instant = true;
    EXPECT_TRUE(rig.coordinator.spin(timing, at(0)).accepted());
}

TEST(SpinCoordinatorTest, InvalidTimingIsRejectedWithoutSideEffects) {
    Rig rig(12u);
    const Grid before = rig.model.cells();

    SpinTiming zero = quickTiming();
    zero.baseDuration = Millis{0.0};
    SpinTiming negativeStagger = quickTiming();
    negativeStagger.stagger = Millis{-1.0};
    SpinTiming negativeSpeed = quickTiming();
    negativeSpeed.scrollSpeed = -3.0;

    for (const SpinTiming& t : {zero, negativeStagger, negativeSpeed}) {
        SpinTicket ticket = rig.coordinator.spin(t, at(0));
        EXPECT_EQ(ticket.status, SpinStatus::InvalidConfig);
        EXPECT_FALSE(rig.coordinator.isSpinning());
    }
    EXPECT_EQ(rig.model.cells(), before);
    EXPECT_TRUE(rig.recorder.events.empty());

    // the rejected requests drew nothing from the generator
    ASSERT_TRUE(rig.coordinator.spin(quickTiming(), at(0)).accepted());
    EXPECT_EQ(rig.coordinator.session()->committed, rig.twin.generate());
}

TEST(SpinCoordinatorTest, GeneratorShapeMismatchIsInvalidConfig) {
    GridModel model(kRows, kCols, 185.0);
    ASSERT_TRUE(model.bind(atlas(), kSymbols));
    ResultGenerator generator(kRows, kCols - 1, kSymbols, 1u);
    PauseController pause;
    SpinCoordinator coordinator(model, generator, pause, WinEvaluator(), Millis{16.67});

    EXPECT_EQ(coordinator.spin(quickTiming(), at(0)).status, SpinStatus::InvalidConfig);
}

TEST(SpinCoordinatorTest, UnboundModelIsNotReady) {
    Rig rig(4u, false);
    EXPECT_EQ(rig.coordinator.spin(quickTiming(), at(0)).status, SpinStatus::NotReady);
}

TEST(SpinCoordinatorTest, StakeCheckCanRefuseTheSpin) {
    Rig rig(21u);
    bool affordable = false;
    rig.coordinator.setStakeCheck([&] { return affordable; });

    EXPECT_EQ(rig.coordinator.spin(quickTiming(), at(0)).status, SpinStatus::InsufficientStake);
    EXPECT_FALSE(rig.coordinator.isSpinning());
    EXPECT_TRUE(rig.recorder.events.empty());

    affordable = true;
    ASSERT_TRUE(rig.coordinator.spin(quickTiming(), at(0)).accepted());
    EXPECT_EQ(rig.coordinator.session()->committed, rig.twin.generate());
}

TEST(SpinCoordinatorTest, PauseHoldsEveryColumnAndResumeContinues) {
    Rig rig(31u);
    SpinTicket ticket = rig.coordinator.spin(quickTiming(), at(0));
    ASSERT_TRUE(ticket.accepted());

    rig.run(0, 50);
    rig.pause.pause(at(50));
    rig.run(50, 5000);
    EXPECT_EQ(rig.coordinator.session()->stoppedCount(), 0);
    EXPECT_FALSE(isReady(ticket.result));

    rig.pause.resume(at(5000));
    rig.run(5000, 5040);
    EXPECT_EQ(rig.coordinator.session()->stoppedCount(), 0);
    rig.coordinator.tick(at(5050));
    EXPECT_EQ(rig.coordinator.session()->stoppedCount(), 1);
    EXPECT_NEAR(rig.coordinator.animator(0).completedElapsed().count(), 100.0, 1e-6);

    rig.run(5050, 5250);
    EXPECT_TRUE(isReady(ticket.result));
}

TEST(SpinCoordinatorTest, SpinAcceptedWhilePausedWaitsForResume) {
    Rig rig(41u);
    rig.pause.pause(at(0));

    SpinTicket ticket = rig.coordinator.spin(quickTiming(), at(10));
    ASSERT_TRUE(ticket.accepted());
    rig.run(10, 1000);
    EXPECT_EQ(rig.coordinator.session()->stoppedCount(), 0);
    EXPECT_DOUBLE_EQ(rig.model.column(0).scrollOffset, 0.0);

    rig.pause.resume(at(1000));
    rig.run(1000, 1090);
    EXPECT_EQ(rig.coordinator.session()->stoppedCount(), 0);
    rig.run(1090, 1300);
    EXPECT_TRUE(isReady(ticket.result));
}

TEST(SpinCoordinatorTest, TeardownBreaksThePendingResult) {
    Rig rig(51u);
    SpinTicket ticket = rig.coordinator.spin(quickTiming(), at(0));
    ASSERT_TRUE(ticket.accepted());
    rig.run(0, 120);

    rig.coordinator.teardown();
    EXPECT_TRUE(rig.coordinator.isTornDown());
    EXPECT_FALSE(rig.coordinator.isSpinning());
    EXPECT_EQ(rig.pause.trackedCount(), 0u);

    try {
        ticket.result.get();
        FAIL() << "expected broken_promise";
    } catch (const std::future_error& e) {
        EXPECT_EQ(e.code(), std::make_error_code(std::future_errc::broken_promise));
    }

    rig.coordinator.tick(at(200));
    EXPECT_EQ(rig.coordinator.spin(quickTiming(), at(300)).status, SpinStatus::NotReady);
}

TEST(SpinCoordinatorTest, ListenerMaySpinAgainFromTheResolvedCallback) {
    struct Respinner : SpinListener {
        SpinCoordinator* coordinator = nullptr;
        SpinTicket next;
        bool respun = false;
        void onSpinResolved(const WinResult&) override {
            if (!respun) {
                respun = true;
                SpinTiming t = quickTiming();
                t.instant = true;
                next = coordinator->spin(t, at(0));
            }
        }
    };

    Rig rig(61u);
    Respinner respinner;
    respinner.coordinator = &rig.coordinator;
    rig.coordinator.addListener(&respinner);

    ASSERT_TRUE(rig.coordinator.spin(quickTiming(), at(0)).accepted());
    rig.run(0, 1000);

    EXPECT_TRUE(respinner.next.accepted());
    EXPECT_TRUE(isReady(respinner.next.result));
    EXPECT_EQ(rig.coordinator.spinsCompleted(), 2u);
    rig.coordinator.removeListener(&respinner);
}
