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
 *    MovementDriver: moves the plank along the rope.
 *
 *    Speed from final balance score:
 *      final > balancedFinalScore:
 *          speed = max(base * speedCurve(final) * balanceSpeedMultiplier,
 *                      base * minSpeedWhenBalanced)
 *      otherwise:
 *          speed = base * minSpeedWhenUnbalanced
 *    Both branches have a floor, so the plank never stops mid-rope.
 *
 *    The normalized path parameter t advances by speed * dt / ropeLength in
 *    the travel direction. Reaching t = 0 or t = 1 stops the plank and flips
 *    the direction for the next ride; the owner detaches the rider.
 *
 *****************************************************************************/

#ifndef __MOVEMENTDRIVER_H
#define __MOVEMENTDRIVER_H

#include <algorithm>

#include "ResponseCurve.h"
#include "RopePath.h"
#include "TightropeMath.h"
#include "logger.h"

namespace Tightrope {

struct MovementParams {
    Vector3 startPoint{0.0f, 10.0f, 0.0f};
    Vector3 endPoint{0.0f, 10.0f, 20.0f};
    ResponseCurve sagCurve = ResponseCurve::sag();
    float maxSag = 2.0f;

    float baseSpeed = 2.0f;          // m/s along the anchor line
    bool  useBalanceSystem = true;   // false: constant speed after startMovement()

    float balancedFinalScore     = 0.5f;  // final score above this counts as balanced
    float balanceSpeedMultiplier = 1.0f;  // how much balance affects speed (0..1)
    float minSpeedWhenUnbalanced = 0.2f;  // fraction of base speed
    float minSpeedWhenBalanced   = 0.1f;  // fraction of base speed
    ResponseCurve speedCurve = ResponseCurve::linear();

    float detectionRange   = 3.0f;   // rider must be this close to board (m)
    float attachmentHeight = 0.1f;   // rider origin above the plank (m)
};

class MovementDriver {
public:
    explicit MovementDriver(const MovementParams &params = MovementParams())
        : mParams(params)
        , mPath(params.startPoint, params.endPoint, params.sagCurve, params.maxSag)
    {
        if (mPath.isDegenerate())
            LOG_ERROR("MovementDriver: rope anchors coincide, plank cannot travel");
    }

    /// Speed for a given final balance score (balance system on)
    float computeSpeed(float finalScore) const {
        float base = mParams.baseSpeed;
        if (finalScore > mParams.balancedFinalScore) {
            float mult = mParams.speedCurve.evaluate(finalScore);
            float speed = base * mult * mParams.balanceSpeedMultiplier;
            return std::max(speed, base * mParams.minSpeedWhenBalanced);
        }
        return base * mParams.minSpeedWhenUnbalanced;
    }

    /// Balance-driven tick: always moving, speed from the score.
    /// Returns true when an endpoint was reached this tick.
    bool stepBalanced(float finalScore, float dt) {
        mMoving = true;
        mCurrentSpeed = computeSpeed(finalScore);
        return advance(dt);
    }

    /// Constant-speed tick used when the balance system is off.
    /// Returns true when an endpoint was reached this tick.
    bool stepManual(float dt) {
        if (!mMoving)
            return false;
        mCurrentSpeed = mParams.baseSpeed;
        return advance(dt);
    }

    void startMovement() { mMoving = true; }

    void stopMovement() {
        mMoving = false;
        mCurrentSpeed = 0.0f;
    }

    /// Back to the start anchor, travelling forward
    void reset() {
        mT = 0.0f;
        mForward = true;
        mMoving = false;
        mCurrentSpeed = 0.0f;
    }

    // ── State access ──

    float getPathPosition() const { return mT; }
    bool isMovingForward() const { return mForward; }
    bool isMoving() const { return mMoving; }
    float getCurrentSpeed() const { return mCurrentSpeed; }

    Vector3 getPlankPosition() const { return mPath.positionAt(mT); }
    Quaternion getPlankOrientation() const { return mPath.orientationAt(mT); }

    /// Where the rider's origin sits while attached
    Vector3 getRiderAnchor() const {
        return getPlankPosition() + worldUp() * mParams.attachmentHeight;
    }

    const RopePath &getPath() const { return mPath; }
    const MovementParams &getParams() const { return mParams; }

    void setBaseSpeed(float speed) { mParams.baseSpeed = std::max(speed, 0.0f); }

private:
    bool advance(float dt) {
        float len = mPath.length();
        if (len < DIRECTION_EPSILON)
            return false;

        float delta = (mCurrentSpeed * dt) / len;

        if (mForward) {
            mT += delta;
            if (mT >= 1.0f) {
                mT = 1.0f;
                reachedEndpoint();
                return true;
            }
        } else {
            mT -= delta;
            if (mT <= 0.0f) {
                mT = 0.0f;
                reachedEndpoint();
                return true;
            }
        }
        return false;
    }

    void reachedEndpoint() {
        mMoving = false;
        mCurrentSpeed = 0.0f;
        mForward = !mForward;
        LOG_INFO("MovementDriver: reached endpoint, next ride goes %s",
                 mForward ? "forward" : "backward");
    }

    MovementParams mParams;
    RopePath mPath;

    float mT = 0.0f;          // 0 = start anchor, 1 = end anchor
    bool mForward = true;
    bool mMoving = false;
    float mCurrentSpeed = 0.0f;
};

} // namespace Tightrope

#endif // __MOVEMENTDRIVER_H
