/******************************************************************************
 *
 *    This file is part of Tightrope
 *    Copyright (C) 2024-2026 Tightrope contributors
 *
 *    This program is free software; you can redistribute it and/or modify
 *    it under the terms of the GNU General Public License as published by
 *    the Free Software Foundation; either version 2 of the License, or
 *    (at your option) any later version.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    GNU General Public License for more details.
 *
 *    You should have received a copy of the GNU General Public License
 *    along with this program; if not, write to the Free Software
 *    Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 *
 *****************************************************************************/

/******************************************************************************
 *
 *    BalanceScorer: turns the tracked head/controller pose into the rider's
 *    balance state. Header-only (inline), matching the rest of the
 *    simulation core.
 *
 *    Three sub-scores, each smoothed by the same single-pole filter
 *    (v += (target - v) * min(1, dt * rate)):
 *    - Orientation: controller forward vectors must point horizontally.
 *      Per hand 1 - clamp01(angle / maxDeviation), combined by min or max.
 *    - Distance: arms spread at least minControllerDistance apart.
 *    - Balance: right-minus-left controller height. Produces both a score
 *      (1 = level) and a signed offset (-1 left side down, +1 right side
 *      down). Optional symmetry penalty on head-relative planar reach.
 *
 *    Final score = orientation * distance * balance. It drives plank speed.
 *
 *    Disruptions are injected with applyDisruption(), which nudges the
 *    smoothed offset directly; the filter then pulls it back toward the
 *    pose-derived target on subsequent ticks.
 *
 *****************************************************************************/

#ifndef __BALANCESCORER_H
#define __BALANCESCORER_H

#include <algorithm>
#include <cmath>
#include <functional>
#include <vector>

#include "TightropeMath.h"
#include "logger.h"
#include "pose/PoseSample.h"

namespace Tightrope {

/// Tunables for BalanceScorer. Defaults match the shipped experience.
struct BalanceParams {
    float balanceThreshold        = 0.15f;  // balanceScore above this counts as balanced
    float smoothingRate           = 5.0f;   // filter rate (1/s)

    float maxPointerAngleDeviation = 15.0f; // degrees from horizontal for orientation 0
    bool  requireBothPointers     = true;   // min() of both hands, else max()

    float minControllerDistance   = 1.2f;   // metres for distance score 1

    float offsetSensitivity       = 3.0f;   // offset per metre of height difference
    float scoreSensitivity        = 4.0f;   // score loss per metre of height difference

    bool  useSymmetryPenalty      = false;  // multiply balance by reach symmetry
    float symmetryTolerance       = 0.3f;   // metres of reach mismatch for penalty 0
};

/// Smoothed balance state. All scores in [0,1], offset in [-1,1].
struct BalanceState {
    float orientationScore = 1.0f;
    float distanceScore    = 1.0f;
    float balanceScore     = 1.0f;
    float balanceOffset    = 0.0f;

    float finalScore() const { return orientationScore * distanceScore * balanceScore; }
};

/// Raw per-tick targets before smoothing (exposed for tests and debugging)
struct BalanceTargets {
    float orientationScore = 1.0f;
    float distanceScore    = 1.0f;
    float balanceScore     = 1.0f;
    float balanceOffset    = 0.0f;
};

/// Observer for balance updates: (finalScore, balanceOffset)
using BalanceChangedCallback = std::function<void(float finalScore, float offset)>;

/// Observer for balance loss: true when the left side is down
using BalanceLostCallback = std::function<void(bool leftSideDown)>;

class BalanceScorer {
public:
    /// |offset| above this is "off-centre" (side label, haptics, loss check)
    static constexpr float CENTRE_DEADBAND = 0.1f;

    /// distance / orientation scores above this count as "good"
    static constexpr float GOOD_SCORE = 0.8f;

    explicit BalanceScorer(const BalanceParams &params = BalanceParams())
        : mParams(params) {}

    // ── Per-tick update ──

    /// Score one pose sample. Returns false (state untouched) when the
    /// sample is incomplete; tracking loss is logged once per dropout.
    bool update(const PoseSample &sample, float dt) {
        if (!sample.isComplete()) {
            if (!mTrackingLost) {
                mTrackingLost = true;
                LOG_ERROR("BalanceScorer: missing pose reference (head=%d left=%d right=%d), "
                          "holding last balance state",
                          sample.head.tracked ? 1 : 0, sample.left.tracked ? 1 : 0,
                          sample.right.tracked ? 1 : 0);
            }
            return false;
        }

        if (mTrackingLost) {
            mTrackingLost = false;
            LOG_INFO("BalanceScorer: tracking restored");
        }

        mTargets = computeTargets(sample);

        float rate = mParams.smoothingRate;
        mState.orientationScore = clamp01(smoothToward(mState.orientationScore, mTargets.orientationScore, dt, rate));
        mState.distanceScore    = clamp01(smoothToward(mState.distanceScore, mTargets.distanceScore, dt, rate));
        mState.balanceScore     = clamp01(smoothToward(mState.balanceScore, mTargets.balanceScore, dt, rate));
        mState.balanceOffset    = clampSigned(smoothToward(mState.balanceOffset, mTargets.balanceOffset, dt, rate));

        float final = mState.finalScore();
        for (const auto &cb : mChangedListeners)
            cb(final, mState.balanceOffset);

        if (final < mParams.balanceThreshold && std::fabs(mState.balanceOffset) > CENTRE_DEADBAND) {
            bool leftDown = mState.balanceOffset < 0.0f;
            for (const auto &cb : mLostListeners)
                cb(leftDown);
        }

        return true;
    }

    /// Compute un-smoothed targets for a complete pose sample
    BalanceTargets computeTargets(const PoseSample &sample) const {
        BalanceTargets t;

        // 1. Orientation: pointer angle from the horizontal plane
        float leftOri = orientationFor(sample.left.forward);
        float rightOri = orientationFor(sample.right.forward);
        t.orientationScore = mParams.requireBothPointers ? std::min(leftOri, rightOri)
                                                         : std::max(leftOri, rightOri);

        // 2. Distance: controller separation
        float separation = glm::length(sample.right.position - sample.left.position);
        t.distanceScore = mParams.minControllerDistance > 0.0f
                              ? clamp01(separation / mParams.minControllerDistance)
                              : 1.0f;

        // 3. Balance: height difference (positive = right hand higher)
        float heightDiff = sample.right.position.y - sample.left.position.y;
        t.balanceOffset = clampSigned(heightDiff * mParams.offsetSensitivity);
        t.balanceScore = clamp01(1.0f - std::fabs(heightDiff) * mParams.scoreSensitivity);

        if (mParams.useSymmetryPenalty)
            t.balanceScore *= symmetryFactor(sample);

        return t;
    }

    /// Nudge the smoothed offset (direction -1 pushes left down, +1 right down)
    void applyDisruption(float amount, float direction) {
        mState.balanceOffset = clampSigned(mState.balanceOffset + amount * direction);
    }

    /// Back to a perfectly balanced state
    void reset() {
        mState = BalanceState();
        mTargets = BalanceTargets();
        mTrackingLost = false;
    }

    // ── Observers ──

    void addBalanceChangedListener(BalanceChangedCallback cb) { mChangedListeners.push_back(std::move(cb)); }
    void addBalanceLostListener(BalanceLostCallback cb) { mLostListeners.push_back(std::move(cb)); }

    // ── State access ──

    const BalanceState &getState() const { return mState; }
    const BalanceTargets &getTargets() const { return mTargets; }
    const BalanceParams &getParams() const { return mParams; }

    float getFinalScore() const { return mState.finalScore(); }
    float getBalanceScore() const { return mState.balanceScore; }
    float getBalanceOffset() const { return mState.balanceOffset; }
    float getOrientationScore() const { return mState.orientationScore; }
    float getDistanceScore() const { return mState.distanceScore; }

    bool isBalanced() const { return mState.balanceScore > mParams.balanceThreshold; }
    bool hasGoodDistance() const { return mState.distanceScore > GOOD_SCORE; }
    bool hasGoodOrientation() const { return mState.orientationScore > GOOD_SCORE; }
    bool isTrackingLost() const { return mTrackingLost; }

private:
    float orientationFor(const Vector3 &forward) const {
        float angle = angleFromHorizontal(forward);
        if (angle < 0.0f)
            return 0.0f;   // degenerate pointer: no usable direction
        if (mParams.maxPointerAngleDeviation <= 0.0f)
            return angle > 0.0f ? 0.0f : 1.0f;
        return 1.0f - clamp01(angle / mParams.maxPointerAngleDeviation);
    }

    float symmetryFactor(const PoseSample &sample) const {
        float leftReach = planarDistance(sample.left.position, sample.head.position);
        float rightReach = planarDistance(sample.right.position, sample.head.position);
        if (mParams.symmetryTolerance <= 0.0f)
            return 1.0f;
        return 1.0f - clamp01(std::fabs(leftReach - rightReach) / mParams.symmetryTolerance);
    }

    BalanceParams mParams;
    BalanceState mState;
    BalanceTargets mTargets;
    bool mTrackingLost = false;

    std::vector<BalanceChangedCallback> mChangedListeners;
    std::vector<BalanceLostCallback> mLostListeners;
};

} // namespace Tightrope

#endif // __BALANCESCORER_H
