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
 *    RiderSimulation: one rider on one plank.
 *
 *    Owns the BalanceScorer, DisruptionGenerator, DifficultyRamp,
 *    MovementDriver and BalanceHaptics, plus the RNG they share and the
 *    grace-period bookkeeping. The host calls step() once per frame with the
 *    latest pose; everything else is advanced from there.
 *
 *    Per attached tick (balance system on):
 *      score pose → grace bookkeeping → difficulty → disruptions → travel → haptics
 *
 *    Attach resets difficulty, grace and balance; detach (manual or at an
 *    endpoint) cancels any in-flight disruption.
 *
 *****************************************************************************/

#ifndef __RIDERSIMULATION_H
#define __RIDERSIMULATION_H

#include <functional>
#include <random>
#include <vector>

#include "TightropeMath.h"
#include "balance/BalanceScorer.h"
#include "config/SimConfig.h"
#include "difficulty/DifficultyRamp.h"
#include "disruption/DisruptionGenerator.h"
#include "haptics/BalanceHaptics.h"
#include "logger.h"
#include "movement/MovementDriver.h"
#include "pose/PoseSample.h"

namespace Tightrope {

/// attached = true on attach, false on detach
using AttachmentCallback = std::function<void(bool attached)>;

/// atEnd = true for the end anchor (t = 1), false for the start anchor
using EndpointCallback = std::function<void(bool atEnd)>;

class RiderSimulation {
public:
    /// haptics may be null
    explicit RiderSimulation(const SimConfig &config, IHapticSink *haptics = nullptr)
        : mConfig(config)
        , mRng(config.seed)
        , mScorer(config.balance)
        , mDisruptor(mScorer, mRng, config.disruption)
        , mRamp(config.difficulty)
        , mDriver(config.movement)
        , mHaptics(haptics, config.haptics)
    {
        mDisruptor.addWarningListener([this](DisruptionType) {
            const DisruptionParams &p = mDisruptor.getParams();
            mHaptics.warn(p.warningHapticStrength, p.warningHapticDuration);
        });
    }

    // listeners capture `this`
    RiderSimulation(const RiderSimulation &) = delete;
    RiderSimulation &operator=(const RiderSimulation &) = delete;

    // ── Per-tick update ──

    void step(const PoseSample &sample, float dt) {
        if (dt < 0.0f)
            dt = 0.0f;
        mSimTime += dt;

        if (mAttached && mConfig.movement.useBalanceSystem) {
            // an incomplete sample freezes scores, so grace stays as it was
            if (mScorer.update(sample, dt))
                updateGraceTracking();

            if (mConfig.difficulty.enabled)
                mRamp.step(mSimTime, &mDisruptor);

            mDisruptor.step(mSimTime, dt, isInGracePeriod());

            if (mDriver.stepBalanced(mScorer.getFinalScore(), dt)) {
                reachedEndpoint();
                return;
            }

            mHaptics.update(mSimTime, mScorer.getBalanceOffset());
        } else if (mDriver.isMoving()) {
            if (mDriver.stepManual(dt))
                reachedEndpoint();
        }
    }

    // ── Rider commands ──

    /// Put the rider on the plank. Returns false if already attached.
    bool attach() {
        if (mAttached)
            return false;

        mAttached = true;
        mScorer.reset();
        mHaptics.reset();

        mWasBalanced = false;
        mLastBalancedTime = mSimTime;

        if (mConfig.difficulty.enabled)
            mRamp.reset(mSimTime, &mDisruptor);

        mDisruptor.start(mSimTime);

        if (!mConfig.movement.useBalanceSystem) {
            mDriver.startMovement();
            LOG_INFO("RiderSimulation: rider attached, moving %s",
                     mDriver.isMovingForward() ? "forward" : "backward");
        } else {
            LOG_INFO("RiderSimulation: rider attached, balance to move");
        }

        for (const auto &cb : mAttachmentListeners)
            cb(true);
        return true;
    }

    /// Attach only when the rider stands within detectionRange of the plank
    bool tryAttach(const Vector3 &riderPosition) {
        if (mAttached || !isNearPlank(riderPosition))
            return false;
        return attach();
    }

    /// Single-button board/leave
    bool toggleAttachment(const Vector3 &riderPosition) {
        if (mAttached)
            return detach();
        return tryAttach(riderPosition);
    }

    /// Take the rider off the plank. Returns false if not attached.
    bool detach() {
        if (!mAttached)
            return false;

        mAttached = false;
        mDriver.stopMovement();
        mDisruptor.stop();
        mHaptics.reset();

        LOG_INFO("RiderSimulation: rider detached at t=%.3f", mDriver.getPathPosition());

        for (const auto &cb : mAttachmentListeners)
            cb(false);
        return true;
    }

    /// Scene reset: plank back to the start anchor, all timers and scaling cleared
    void reset() {
        detach();
        mDriver.reset();
        mScorer.reset();
        mHaptics.reset();
        mDisruptor.stop();

        mWasBalanced = false;
        mLastBalancedTime = mSimTime;

        if (mConfig.difficulty.enabled)
            mRamp.reset(mSimTime, &mDisruptor);
        else
            mDisruptor.restoreBaseValues();

        LOG_INFO("RiderSimulation: reset to initial state");
    }

    /// Start constant-speed travel (balance system off)
    void startMovement() {
        if (mAttached)
            mDriver.startMovement();
    }

    void stopMovement() { mDriver.stopMovement(); }

    bool isNearPlank(const Vector3 &riderPosition) const {
        return glm::length(riderPosition - mDriver.getPlankPosition()) <=
               mConfig.movement.detectionRange;
    }

    // ── Grace period ──

    bool isInGracePeriod() const {
        return mWasBalanced && (getTimeSinceBalanced() < mConfig.difficulty.gracePeriodAfterBalance);
    }

    float getTimeSinceBalanced() const { return mSimTime - mLastBalancedTime; }

    /// Seconds of grace left (0 when not in grace)
    float getGraceRemaining() const {
        if (!isInGracePeriod())
            return 0.0f;
        return mConfig.difficulty.gracePeriodAfterBalance - getTimeSinceBalanced();
    }

    // ── Observers ──

    void addAttachmentListener(AttachmentCallback cb) { mAttachmentListeners.push_back(std::move(cb)); }
    void addEndpointListener(EndpointCallback cb) { mEndpointListeners.push_back(std::move(cb)); }

    // ── State access ──

    float getFinalScore() const { return mScorer.getFinalScore(); }
    float getBalanceScore() const { return mScorer.getBalanceScore(); }
    float getBalanceOffset() const { return mScorer.getBalanceOffset(); }
    float getOrientationScore() const { return mScorer.getOrientationScore(); }
    float getDistanceScore() const { return mScorer.getDistanceScore(); }
    bool isBalanced() const { return mScorer.isBalanced(); }

    bool isAttached() const { return mAttached; }
    bool isMoving() const { return mDriver.isMoving(); }
    float getSimTime() const { return mSimTime; }
    float getPathPosition() const { return mDriver.getPathPosition(); }
    Vector3 getPlankPosition() const { return mDriver.getPlankPosition(); }
    Quaternion getPlankOrientation() const { return mDriver.getPlankOrientation(); }
    float getDifficultyMultiplier() const { return mRamp.getMultiplier(); }

    const SimConfig &getConfig() const { return mConfig; }

    BalanceScorer &getScorer() { return mScorer; }
    const BalanceScorer &getScorer() const { return mScorer; }
    DisruptionGenerator &getDisruptor() { return mDisruptor; }
    const DisruptionGenerator &getDisruptor() const { return mDisruptor; }
    const DifficultyRamp &getDifficulty() const { return mRamp; }
    const MovementDriver &getMovement() const { return mDriver; }
    MovementDriver &getMovement() { return mDriver; }

private:
    /// "Balanced" for grace purposes means the final score would move the
    /// plank at balanced speed
    void updateGraceTracking() {
        bool balanced = mScorer.getFinalScore() > mConfig.movement.balancedFinalScore;
        if (balanced && !mWasBalanced)
            mLastBalancedTime = mSimTime;
        mWasBalanced = balanced;
    }

    void reachedEndpoint() {
        bool atEnd = mDriver.getPathPosition() >= 1.0f;
        mDisruptor.stop();
        detach();
        for (const auto &cb : mEndpointListeners)
            cb(atEnd);
    }

    SimConfig mConfig;
    std::mt19937 mRng;

    BalanceScorer mScorer;
    DisruptionGenerator mDisruptor;
    DifficultyRamp mRamp;
    MovementDriver mDriver;
    BalanceHaptics mHaptics;

    float mSimTime = 0.0f;
    bool mAttached = false;

    bool mWasBalanced = false;
    float mLastBalancedTime = 0.0f;

    std::vector<AttachmentCallback> mAttachmentListeners;
    std::vector<EndpointCallback> mEndpointListeners;
};

} // namespace Tightrope

#endif // __RIDERSIMULATION_H
