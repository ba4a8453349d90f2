// Unit tests for disruption waveforms and the DisruptionGenerator state machine
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <random>
#include <vector>

#include "TightropeMath.h"
#include "balance/BalanceScorer.h"
#include "disruption/DisruptionGenerator.h"
#include "disruption/DisruptionWaveform.h"
#include "pose/PoseSample.h"

using namespace Tightrope;
using Catch::Approx;

static const float TICK = 0.01f;

// Helper: parameters with short fixed gaps and no warning phase
static DisruptionParams quickParams() {
    DisruptionParams p;
    p.minTimeBetween = 1.0f;
    p.maxTimeBetween = 1.0f;
    p.provideWarning = false;
    p.disruptionChance = 1.0f;
    return p;
}

// Helper: counts listener traffic and tracks overlap
struct EventLog {
    int warnings = 0;
    int started = 0;
    int ended = 0;
    int interrupted = 0;
    bool active = false;
    bool overlapped = false;

    void attach(DisruptionGenerator &gen) {
        gen.addWarningListener([this](DisruptionType) { ++warnings; });
        gen.addStartedListener([this](const DisruptionEvent &) {
            if (active)
                overlapped = true;
            active = true;
            ++started;
        });
        gen.addEndedListener([this](const DisruptionEvent &, bool wasInterrupted) {
            active = false;
            ++ended;
            if (wasInterrupted)
                ++interrupted;
        });
    }
};

// ---- Waveforms ----

TEST_CASE("Gust peaks at onset and fades linearly", "[disruption][waveform]") {
    DisruptionEvent ev;
    ev.type = DisruptionType::Gust;
    ev.strength = 0.5f;
    ev.duration = 0.3f;

    CHECK(disruptionStrengthAt(ev, 0.0f) == Approx(0.5f));
    CHECK(disruptionStrengthAt(ev, 0.15f) == Approx(0.25f));
    CHECK(disruptionStrengthAt(ev, 0.3f) == Approx(0.0f).margin(1e-6));
    CHECK(disruptionStrengthAt(ev, 0.31f) == 0.0f);
    CHECK(disruptionStrengthAt(ev, -0.01f) == 0.0f);
}

TEST_CASE("Drift follows a half sine", "[disruption][waveform]") {
    DisruptionEvent ev;
    ev.type = DisruptionType::Drift;
    ev.strength = 0.2f;
    ev.duration = 2.0f;

    CHECK(disruptionStrengthAt(ev, 0.0f) == Approx(0.0f).margin(1e-6));
    CHECK(disruptionStrengthAt(ev, 1.0f) == Approx(0.2f));
    CHECK(disruptionStrengthAt(ev, 0.5f) == Approx(0.2f * std::sin(glm::pi<float>() * 0.25f)));
    CHECK(disruptionStrengthAt(ev, 2.0f) == Approx(0.0f).margin(1e-5));
}

TEST_CASE("Oscillation sways with a fading envelope", "[disruption][waveform]") {
    DisruptionEvent ev;
    ev.type = DisruptionType::Oscillation;
    ev.strength = 0.15f;
    ev.frequency = 1.0f;
    ev.duration = 4.0f;

    CHECK(disruptionStrengthAt(ev, 0.0f) == Approx(0.0f).margin(1e-6));
    CHECK(disruptionStrengthAt(ev, 0.25f) == Approx(0.15f * (1.0f - 0.25f / 4.0f)));
    CHECK(disruptionStrengthAt(ev, 0.75f) == Approx(-0.15f * (1.0f - 0.75f / 4.0f)));
    CHECK(disruptionStrengthAt(ev, 4.0f) == Approx(0.0f).margin(1e-6));
}

TEST_CASE("Zero-length event contributes nothing", "[disruption][waveform]") {
    DisruptionEvent ev;
    ev.type = DisruptionType::Gust;
    ev.strength = 1.0f;
    ev.duration = 0.0f;
    CHECK(disruptionStrengthAt(ev, 0.0f) == 0.0f);
}

// ---- Generator ----

TEST_CASE("Due disruption starts immediately without warning", "[disruption][generator]") {
    BalanceScorer scorer;
    std::mt19937 rng(7);
    DisruptionParams p = quickParams();
    p.enableGusts = false;
    p.enableOscillations = false;
    DisruptionGenerator gen(scorer, rng, p);
    EventLog log;
    log.attach(gen);

    gen.start(0.0f);
    CHECK(gen.getNextDisruptionTime() == Approx(1.0f));

    for (int i = 1; i <= 99; ++i)
        gen.step(i * TICK, TICK, false);
    CHECK(gen.getPhase() == DisruptionPhase::Idle);

    gen.step(1.0f, TICK, false);
    CHECK(gen.getPhase() == DisruptionPhase::Active);
    CHECK(log.started == 1);
    CHECK(log.warnings == 0);
    CHECK(gen.getEvent().type == DisruptionType::Drift);
    CHECK(gen.getEvent().strength >= 0.1f);
    CHECK(gen.getEvent().strength <= 0.3f);
    CHECK(gen.getEvent().duration == Approx(2.0f));
}

TEST_CASE("Warning precedes the active phase", "[disruption][generator]") {
    BalanceScorer scorer;
    std::mt19937 rng(11);
    DisruptionParams p = quickParams();
    p.provideWarning = true;
    p.warningTime = 0.5f;
    p.enableGusts = false;
    p.enableOscillations = false;
    DisruptionGenerator gen(scorer, rng, p);
    EventLog log;
    log.attach(gen);

    gen.start(0.0f);
    for (int i = 1; i <= 120; ++i)
        gen.step(i * TICK, TICK, false);

    CHECK(gen.getPhase() == DisruptionPhase::Warning);
    CHECK(gen.isDisrupting());
    CHECK_FALSE(gen.isActive());
    CHECK(log.warnings == 1);
    CHECK(log.started == 0);
    CHECK(gen.getCurrentStrength(1.2f) == 0.0f);

    for (int i = 121; i <= 160; ++i)
        gen.step(i * TICK, TICK, false);

    CHECK(gen.getPhase() == DisruptionPhase::Active);
    CHECK(log.started == 1);
    CHECK(log.warnings == 1);
}

TEST_CASE("Only one disruption is ever active", "[disruption][generator]") {
    BalanceScorer scorer;
    std::mt19937 rng(99);
    DisruptionParams p = quickParams();
    p.minTimeBetween = 0.0f;
    p.maxTimeBetween = 0.2f;
    DisruptionGenerator gen(scorer, rng, p);
    EventLog log;
    log.attach(gen);

    gen.start(0.0f);
    for (int i = 1; i <= 6000; ++i) {
        gen.step(i * TICK, TICK, false);
        // keep the rider balanced so every due roll fires
        scorer.reset();
    }

    CHECK(log.started > 10);
    CHECK_FALSE(log.overlapped);
    CHECK(log.started - log.ended <= 1);
    CHECK(log.interrupted == 0);
}

TEST_CASE("No disruption starts during the grace period", "[disruption][grace]") {
    BalanceScorer scorer;
    std::mt19937 rng(3);
    DisruptionGenerator gen(scorer, rng, quickParams());
    EventLog log;
    log.attach(gen);

    gen.start(0.0f);
    float due = gen.getNextDisruptionTime();

    for (int i = 1; i <= 3000; ++i)
        gen.step(i * TICK, TICK, true);

    CHECK(log.started == 0);
    CHECK(gen.getPhase() == DisruptionPhase::Idle);
    // the pending disruption waits rather than being rescheduled
    CHECK(gen.getNextDisruptionTime() == due);

    // grace over: the overdue disruption fires on the next tick
    gen.step(30.01f, TICK, false);
    CHECK(gen.isActive());
    CHECK(log.started == 1);
}

TEST_CASE("Grace or lost balance during a warning holds the disruption back",
          "[disruption][grace]") {
    BalanceScorer scorer;
    std::mt19937 rng(3);
    DisruptionParams p = quickParams();
    p.provideWarning = true;
    p.warningTime = 0.5f;
    DisruptionGenerator gen(scorer, rng, p);
    EventLog log;
    log.attach(gen);

    gen.start(0.0f);
    float due = gen.getNextDisruptionTime();
    for (int i = 1; i <= 110; ++i)
        gen.step(i * TICK, TICK, false);
    REQUIRE(gen.getPhase() == DisruptionPhase::Warning);
    REQUIRE(log.warnings == 1);

    SECTION("grace begins: back to idle, due time kept") {
        for (int i = 111; i <= 300; ++i)
            gen.step(i * TICK, TICK, true);

        CHECK(log.started == 0);
        CHECK(gen.getPhase() == DisruptionPhase::Idle);
        CHECK(gen.getNextDisruptionTime() == due);

        // grace over: warned again, then played
        for (int i = 301; i <= 360; ++i)
            gen.step(i * TICK, TICK, false);
        CHECK(log.warnings == 2);
        CHECK(log.started == 1);
        CHECK(gen.isActive());
    }

    SECTION("rider loses balance: skipped and rescheduled") {
        PoseSample tilted;
        tilted.left.position = Vector3(-0.7f, 1.4f, 0.0f);
        tilted.right.position = Vector3(0.7f, 1.9f, 0.0f);
        for (int i = 0; i < 200; ++i)
            scorer.update(tilted, TICK);
        REQUIRE_FALSE(scorer.isBalanced());

        for (int i = 111; i <= 160; ++i)
            gen.step(i * TICK, TICK, false);

        CHECK(log.started == 0);
        CHECK(gen.getPhase() == DisruptionPhase::Idle);
        CHECK(gen.getNextDisruptionTime() > due);
    }
}

TEST_CASE("Zero chance never fires", "[disruption][chance]") {
    BalanceScorer scorer;
    std::mt19937 rng(5);
    DisruptionParams p = quickParams();
    p.disruptionChance = 0.0f;
    DisruptionGenerator gen(scorer, rng, p);
    EventLog log;
    log.attach(gen);

    gen.start(0.0f);
    for (int i = 1; i <= 100000; ++i) {
        gen.step(i * TICK, TICK, false);
        REQUIRE_FALSE(gen.isDisrupting());
    }

    CHECK(log.started == 0);
    CHECK(log.warnings == 0);
    // failed rolls reschedule
    CHECK(gen.getNextDisruptionTime() > 999.0f);
}

TEST_CASE("Chance clamps to [0,1]", "[disruption][chance]") {
    BalanceScorer scorer;
    std::mt19937 rng(5);
    DisruptionGenerator gen(scorer, rng, quickParams());

    gen.setDisruptionChance(4.0f);
    CHECK(gen.getParams().disruptionChance == 1.0f);
    gen.setDisruptionChance(-1.0f);
    CHECK(gen.getParams().disruptionChance == 0.0f);
}

TEST_CASE("No enabled waveform leaves the generator inert", "[disruption][generator]") {
    BalanceScorer scorer;
    std::mt19937 rng(5);
    DisruptionParams p = quickParams();
    p.enableGusts = false;
    p.enableDrift = false;
    p.enableOscillations = false;
    DisruptionGenerator gen(scorer, rng, p);
    EventLog log;
    log.attach(gen);

    gen.start(0.0f);
    for (int i = 1; i <= 2000; ++i)
        gen.step(i * TICK, TICK, false);

    CHECK(log.started == 0);
    CHECK(gen.getPhase() == DisruptionPhase::Idle);
    CHECK(scorer.getBalanceOffset() == 0.0f);
}

TEST_CASE("Disabled generator never schedules a start", "[disruption][generator]") {
    BalanceScorer scorer;
    std::mt19937 rng(5);
    DisruptionParams p = quickParams();
    p.enabled = false;
    DisruptionGenerator gen(scorer, rng, p);

    gen.start(0.0f);
    for (int i = 1; i <= 2000; ++i)
        gen.step(i * TICK, TICK, false);
    CHECK_FALSE(gen.isDisrupting());
}

TEST_CASE("Unbalanced rider is not disrupted", "[disruption][generator]") {
    BalanceScorer scorer;

    // right hand half a metre high: balance score collapses
    PoseSample tilted;
    tilted.left.position = Vector3(-0.7f, 1.4f, 0.0f);
    tilted.right.position = Vector3(0.7f, 1.9f, 0.0f);
    for (int i = 0; i < 200; ++i)
        scorer.update(tilted, TICK);
    REQUIRE_FALSE(scorer.isBalanced());

    std::mt19937 rng(5);
    DisruptionGenerator gen(scorer, rng, quickParams());
    EventLog log;
    log.attach(gen);

    gen.start(0.0f);
    for (int i = 1; i <= 1000; ++i)
        gen.step(i * TICK, TICK, false);

    CHECK(log.started == 0);
    CHECK(gen.getNextDisruptionTime() > 9.0f);
}

TEST_CASE("Active disruption pushes the offset in its direction", "[disruption][generator]") {
    BalanceScorer scorer;
    std::mt19937 rng(21);
    DisruptionGenerator gen(scorer, rng, quickParams());

    REQUIRE(gen.trigger(DisruptionType::Gust, 0.0f));
    REQUIRE(gen.isActive());

    float dir = gen.getEvent().direction;
    CHECK((dir == 1.0f || dir == -1.0f));

    gen.step(TICK, TICK, false);
    float offset = scorer.getBalanceOffset();
    CHECK(offset * dir > 0.0f);
    CHECK(std::fabs(offset) <= gen.getEvent().strength * TICK + 1e-6f);
    CHECK(gen.getCurrentStrength(TICK) * dir > 0.0f);

    // runs out after its duration and goes back to idle
    for (int i = 2; i <= 40; ++i)
        gen.step(i * TICK, TICK, false);
    CHECK(gen.getPhase() == DisruptionPhase::Idle);
    CHECK(gen.getNextDisruptionTime() > 0.3f);
}

TEST_CASE("Oscillation always starts in the positive direction", "[disruption][generator]") {
    BalanceScorer scorer;
    std::mt19937 rng(42);
    DisruptionGenerator gen(scorer, rng, quickParams());

    REQUIRE(gen.trigger(DisruptionType::Oscillation, 2.0f));
    CHECK(gen.getEvent().direction == 1.0f);
    CHECK(gen.getEvent().strength == Approx(0.15f));
    CHECK(gen.getEvent().frequency == Approx(1.0f));
    CHECK(gen.getEvent().startTime == 2.0f);
}

TEST_CASE("stop() interrupts an active disruption", "[disruption][lifecycle]") {
    BalanceScorer scorer;
    std::mt19937 rng(8);
    DisruptionGenerator gen(scorer, rng, quickParams());
    EventLog log;
    log.attach(gen);

    SECTION("active: ended fires once with interrupted set") {
        REQUIRE(gen.trigger(DisruptionType::Drift, 0.0f));
        gen.step(TICK, TICK, false);
        gen.stop();
        CHECK(gen.getPhase() == DisruptionPhase::Idle);
        CHECK(log.ended == 1);
        CHECK(log.interrupted == 1);

        gen.stop();
        CHECK(log.ended == 1);
    }

    SECTION("warning: silently cancelled") {
        DisruptionParams p = quickParams();
        p.provideWarning = true;
        gen.setParams(p);
        REQUIRE(gen.trigger(DisruptionType::Gust, 0.0f));
        CHECK(gen.getPhase() == DisruptionPhase::Warning);
        gen.stop();
        CHECK(gen.getPhase() == DisruptionPhase::Idle);
        CHECK(log.ended == 0);
    }

    SECTION("start() cancels and re-arms") {
        REQUIRE(gen.trigger(DisruptionType::Drift, 0.0f));
        gen.start(5.0f);
        CHECK(gen.getPhase() == DisruptionPhase::Idle);
        CHECK(log.interrupted == 1);
        CHECK(gen.getNextDisruptionTime() == Approx(6.0f));
    }
}

TEST_CASE("trigger() is ignored while a disruption is in flight", "[disruption][lifecycle]") {
    BalanceScorer scorer;
    std::mt19937 rng(8);
    DisruptionGenerator gen(scorer, rng, quickParams());

    REQUIRE(gen.trigger(DisruptionType::Drift, 0.0f));
    CHECK_FALSE(gen.trigger(DisruptionType::Gust, 0.1f));
    CHECK(gen.getEvent().type == DisruptionType::Drift);
}

TEST_CASE("Same seed gives the same disruption sequence", "[disruption][determinism]") {
    auto run = [](unsigned int seed) {
        BalanceScorer scorer;
        std::mt19937 rng(seed);
        DisruptionParams p = quickParams();
        p.minTimeBetween = 0.5f;
        p.maxTimeBetween = 3.0f;
        DisruptionGenerator gen(scorer, rng, p);

        std::vector<float> starts;
        gen.addStartedListener([&starts](const DisruptionEvent &ev) {
            starts.push_back(ev.startTime);
            starts.push_back(ev.strength * ev.direction);
        });

        gen.start(0.0f);
        for (int i = 1; i <= 6000; ++i) {
            gen.step(i * TICK, TICK, false);
            scorer.reset();
        }
        return starts;
    };

    std::vector<float> a = run(1234);
    std::vector<float> b = run(1234);
    REQUIRE_FALSE(a.empty());
    CHECK(a == b);
}
