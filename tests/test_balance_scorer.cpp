// Unit tests for BalanceScorer (pose -> smoothed balance state)
#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <random>
#include <vector>

#include "TightropeMath.h"
#include "balance/BalanceScorer.h"
#include "pose/PoseSample.h"

using namespace Tightrope;
using Catch::Approx;

// Helper: T-pose with the hands `separation` apart on X at the given heights,
// both controllers pointing straight ahead.
static PoseSample makePose(float leftY, float rightY, float separation = 1.4f) {
    PoseSample s;
    s.head.position = Vector3(0.0f, 1.6f, 0.0f);
    s.left.position = Vector3(-separation * 0.5f, leftY, 0.0f);
    s.right.position = Vector3(separation * 0.5f, rightY, 0.0f);
    return s;
}

// Helper: forward vector pitched `degrees` above the horizontal
static Vector3 pitched(float degrees) {
    float r = glm::radians(degrees);
    return Vector3(0.0f, std::sin(r), std::cos(r));
}

static const float TICK = 1.0f / 90.0f;

// ---- Test cases ----

TEST_CASE("Level T-pose keeps every score at 1", "[balance]") {
    BalanceScorer scorer;
    PoseSample pose = makePose(1.4f, 1.4f);

    for (int i = 0; i < 180; ++i)
        REQUIRE(scorer.update(pose, TICK));

    CHECK(scorer.getOrientationScore() == Approx(1.0f));
    CHECK(scorer.getDistanceScore() == Approx(1.0f));
    CHECK(scorer.getBalanceScore() == Approx(1.0f));
    CHECK(scorer.getBalanceOffset() == Approx(0.0f).margin(1e-6));
    CHECK(scorer.getFinalScore() == Approx(1.0f));
    CHECK(scorer.isBalanced());
    CHECK(scorer.hasGoodDistance());
    CHECK(scorer.hasGoodOrientation());
}

TEST_CASE("Raised right hand pulls the offset towards its target without overshoot", "[balance][smoothing]") {
    BalanceParams p;
    p.offsetSensitivity = 2.0f;
    BalanceScorer scorer(p);

    PoseSample pose = makePose(1.4f, 1.7f);   // right 0.3m higher

    float previous = scorer.getBalanceOffset();
    for (int i = 0; i < 270; ++i) {
        scorer.update(pose, TICK);
        float now = scorer.getBalanceOffset();
        REQUIRE(now >= previous);
        REQUIRE(now <= 0.6f + 1e-5f);
        previous = now;
    }

    CHECK(scorer.getTargets().balanceOffset == Approx(0.6f));
    CHECK(scorer.getBalanceOffset() == Approx(0.6f).margin(1e-3));

    // 1 - 0.3 * 4 clamps to zero
    CHECK(scorer.getTargets().balanceScore == Approx(0.0f));
    CHECK(scorer.getBalanceScore() < p.balanceThreshold);
    CHECK_FALSE(scorer.isBalanced());
}

TEST_CASE("Single tick moves dt * rate of the way", "[balance][smoothing]") {
    BalanceParams p;
    p.offsetSensitivity = 2.0f;
    p.smoothingRate = 5.0f;
    BalanceScorer scorer(p);

    scorer.update(makePose(1.4f, 1.7f), 0.1f);
    CHECK(scorer.getBalanceOffset() == Approx(0.3f));

    // dt * rate >= 1 snaps straight to the target
    scorer.update(makePose(1.4f, 1.7f), 1.0f);
    CHECK(scorer.getBalanceOffset() == Approx(0.6f));
}

TEST_CASE("Scores stay clamped for arbitrary poses", "[balance][clamp]") {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<float> pos(-3.0f, 3.0f);
    std::uniform_real_distribution<float> dir(-1.0f, 1.0f);
    std::uniform_real_distribution<float> step(0.0f, 0.5f);

    BalanceParams p;
    p.useSymmetryPenalty = true;
    BalanceScorer scorer(p);

    for (int i = 0; i < 2000; ++i) {
        PoseSample s;
        s.head.position = Vector3(pos(rng), pos(rng), pos(rng));
        s.left.position = Vector3(pos(rng), pos(rng), pos(rng));
        s.right.position = Vector3(pos(rng), pos(rng), pos(rng));
        s.left.forward = (i % 17 == 0) ? Vector3(0.0f) : Vector3(dir(rng), dir(rng), dir(rng));
        s.right.forward = Vector3(dir(rng), dir(rng), dir(rng));

        scorer.update(s, step(rng));
        if (i % 5 == 0)
            scorer.applyDisruption(dir(rng) * 3.0f, 1.0f);

        const BalanceState &st = scorer.getState();
        REQUIRE(st.orientationScore >= 0.0f);
        REQUIRE(st.orientationScore <= 1.0f);
        REQUIRE(st.distanceScore >= 0.0f);
        REQUIRE(st.distanceScore <= 1.0f);
        REQUIRE(st.balanceScore >= 0.0f);
        REQUIRE(st.balanceScore <= 1.0f);
        REQUIRE(st.balanceOffset >= -1.0f);
        REQUIRE(st.balanceOffset <= 1.0f);
        REQUIRE(st.finalScore() >= 0.0f);
        REQUIRE(st.finalScore() <= 1.0f);
    }
}

TEST_CASE("Missing pose reference freezes the state", "[balance][tracking]") {
    BalanceScorer scorer;

    for (int i = 0; i < 30; ++i)
        scorer.update(makePose(1.4f, 1.5f), TICK);

    BalanceState before = scorer.getState();

    PoseSample lost = makePose(1.0f, 2.0f, 0.2f);
    lost.right.tracked = false;

    for (int i = 0; i < 30; ++i)
        CHECK_FALSE(scorer.update(lost, TICK));

    CHECK(scorer.isTrackingLost());
    CHECK(scorer.getBalanceOffset() == before.balanceOffset);
    CHECK(scorer.getBalanceScore() == before.balanceScore);
    CHECK(scorer.getDistanceScore() == before.distanceScore);

    SECTION("head loss counts too") {
        PoseSample noHead = makePose(1.4f, 1.4f);
        noHead.head.tracked = false;
        CHECK_FALSE(scorer.update(noHead, TICK));
    }

    SECTION("tracking comes back") {
        CHECK(scorer.update(makePose(1.4f, 1.4f), TICK));
        CHECK_FALSE(scorer.isTrackingLost());
    }
}

TEST_CASE("Orientation from pointer pitch", "[balance][orientation]") {
    BalanceScorer scorer;

    SECTION("half the allowed deviation scores 0.5") {
        PoseSample s = makePose(1.4f, 1.4f);
        s.left.forward = pitched(7.5f);
        s.right.forward = pitched(7.5f);
        CHECK(scorer.computeTargets(s).orientationScore == Approx(0.5f));
    }

    SECTION("pointing down is as bad as pointing up") {
        PoseSample s = makePose(1.4f, 1.4f);
        s.left.forward = pitched(-7.5f);
        s.right.forward = pitched(7.5f);
        CHECK(scorer.computeTargets(s).orientationScore == Approx(0.5f));
    }

    SECTION("beyond the limit scores 0") {
        PoseSample s = makePose(1.4f, 1.4f);
        s.left.forward = pitched(40.0f);
        CHECK(scorer.computeTargets(s).orientationScore == Approx(0.0f));
    }

    SECTION("straight up scores 0") {
        PoseSample s = makePose(1.4f, 1.4f);
        s.right.forward = Vector3(0.0f, 1.0f, 0.0f);
        CHECK(scorer.computeTargets(s).orientationScore == Approx(0.0f));
    }

    SECTION("degenerate forward vector scores 0") {
        PoseSample s = makePose(1.4f, 1.4f);
        s.left.forward = Vector3(0.0f);
        CHECK(scorer.computeTargets(s).orientationScore == Approx(0.0f));

        for (int i = 0; i < 200; ++i)
            scorer.update(s, TICK);
        CHECK(scorer.getOrientationScore() < 0.01f);
        CHECK(scorer.getFinalScore() < 0.01f);
        CHECK_FALSE(scorer.hasGoodOrientation());
    }
}

TEST_CASE("Orientation combine: min with both required, max otherwise", "[balance][orientation]") {
    PoseSample s = makePose(1.4f, 1.4f);
    s.left.forward = pitched(0.0f);
    s.right.forward = pitched(7.5f);

    BalanceParams both;
    both.requireBothPointers = true;
    CHECK(BalanceScorer(both).computeTargets(s).orientationScore == Approx(0.5f));

    BalanceParams either;
    either.requireBothPointers = false;
    CHECK(BalanceScorer(either).computeTargets(s).orientationScore == Approx(1.0f));
}

TEST_CASE("Distance score scales with controller separation", "[balance][distance]") {
    BalanceScorer scorer;

    CHECK(scorer.computeTargets(makePose(1.4f, 1.4f, 0.6f)).distanceScore == Approx(0.5f));
    CHECK(scorer.computeTargets(makePose(1.4f, 1.4f, 1.2f)).distanceScore == Approx(1.0f));
    CHECK(scorer.computeTargets(makePose(1.4f, 1.4f, 2.0f)).distanceScore == Approx(1.0f));
    CHECK(scorer.computeTargets(makePose(1.4f, 1.4f, 0.0f)).distanceScore == Approx(0.0f));
}

TEST_CASE("Symmetry penalty on uneven reach", "[balance][symmetry]") {
    PoseSample s = makePose(1.4f, 1.4f);
    s.left.position = Vector3(-0.7f, 1.4f, 0.0f);
    s.right.position = Vector3(0.85f, 1.4f, 0.0f);

    BalanceParams off;
    CHECK(BalanceScorer(off).computeTargets(s).balanceScore == Approx(1.0f));

    BalanceParams on;
    on.useSymmetryPenalty = true;
    on.symmetryTolerance = 0.3f;
    CHECK(BalanceScorer(on).computeTargets(s).balanceScore == Approx(0.5f));
}

TEST_CASE("Balance notifications", "[balance][events]") {
    BalanceScorer scorer;

    std::vector<float> finals;
    std::vector<bool> lost;
    scorer.addBalanceChangedListener([&](float final, float) { finals.push_back(final); });
    scorer.addBalanceLostListener([&](bool leftDown) { lost.push_back(leftDown); });

    SECTION("changed fires every scored tick") {
        for (int i = 0; i < 10; ++i)
            scorer.update(makePose(1.4f, 1.4f), TICK);
        CHECK(finals.size() == 10);
        CHECK(lost.empty());
    }

    SECTION("left hand high gives a negative offset and a left-down loss") {
        for (int i = 0; i < 200; ++i)
            scorer.update(makePose(1.9f, 1.4f), TICK);
        REQUIRE_FALSE(lost.empty());
        CHECK(lost.back() == true);
        CHECK(scorer.getBalanceOffset() < -0.9f);
    }

    SECTION("right hand high gives a positive offset") {
        for (int i = 0; i < 200; ++i)
            scorer.update(makePose(1.4f, 1.9f), TICK);
        REQUIRE_FALSE(lost.empty());
        CHECK(lost.back() == false);
    }

    SECTION("no notifications while frozen") {
        PoseSample s = makePose(1.4f, 1.4f);
        s.left.tracked = false;
        scorer.update(s, TICK);
        CHECK(finals.empty());
    }
}

TEST_CASE("Disruption nudges the offset and is clamped", "[balance][disruption]") {
    BalanceScorer scorer;

    scorer.applyDisruption(0.25f, -1.0f);
    CHECK(scorer.getBalanceOffset() == Approx(-0.25f));

    scorer.applyDisruption(5.0f, 1.0f);
    CHECK(scorer.getBalanceOffset() == Approx(1.0f));

    // the filter pulls it back towards the level pose
    for (int i = 0; i < 270; ++i)
        scorer.update(makePose(1.4f, 1.4f), TICK);
    CHECK(scorer.getBalanceOffset() == Approx(0.0f).margin(1e-3));

    scorer.applyDisruption(0.5f, 1.0f);
    scorer.reset();
    CHECK(scorer.getBalanceOffset() == 0.0f);
    CHECK(scorer.getFinalScore() == Approx(1.0f));
}
