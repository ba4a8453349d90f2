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
 *    BalanceHaptics: vibration cues. While the rider is off-centre the
 *    lower hand gets a pulse every repeatInterval, stronger the further
 *    off-centre they are. Disruption warnings pulse both hands.
 *
 *    The device side is IHapticSink, implemented by the host.
 *
 *****************************************************************************/

#ifndef __BALANCEHAPTICS_H
#define __BALANCEHAPTICS_H

#include <cmath>

#include "TightropeMath.h"
#include "logger.h"
#include "pose/PoseSample.h"

namespace Tightrope {

/// Haptic output supplied by the host
class IHapticSink {
public:
    virtual ~IHapticSink() = default;

    /// Returns false when the device is unavailable or cannot vibrate
    virtual bool sendHapticImpulse(Hand hand, float amplitude, float duration) = 0;
};

struct HapticParams {
    float minStrength    = 0.3f;   // amplitude just past the dead band
    float maxStrength    = 0.8f;   // amplitude at |offset| = 1
    float duration       = 0.2f;   // seconds per pulse
    float repeatInterval = 0.5f;   // seconds between pulses while off-centre
};

/// Which side is down, from the balance offset
enum class BalanceSide {
    Centered,
    LeftDown,
    RightDown
};

inline BalanceSide balanceSideFor(float offset, float deadband) {
    if (offset < -deadband)
        return BalanceSide::LeftDown;
    if (offset > deadband)
        return BalanceSide::RightDown;
    return BalanceSide::Centered;
}

class BalanceHaptics {
public:
    static constexpr float CENTRE_DEADBAND = 0.1f;
    static constexpr float NEVER = -999.0f;

    /// sink may be null (no haptics available)
    explicit BalanceHaptics(IHapticSink *sink, const HapticParams &params = HapticParams())
        : mSink(sink), mParams(params) {}

    /// Per attached tick. Returns true if a pulse was sent.
    bool update(float now, float offset) {
        BalanceSide side = balanceSideFor(offset, CENTRE_DEADBAND);

        if (side == BalanceSide::Centered) {
            if (mLastSide != BalanceSide::Centered)
                LOG_DEBUG("BalanceHaptics: back to centre, pulses stopped");
            // re-arm so the next lean pulses immediately
            mLastPulseTime = NEVER;
            mLastSide = side;
            return false;
        }

        mLastSide = side;

        if (now - mLastPulseTime < mParams.repeatInterval)
            return false;

        float strength = pulseStrength(offset);
        Hand hand = (side == BalanceSide::LeftDown) ? Hand::Left : Hand::Right;

        if (!mSink)
            return false;

        // a rejected impulse still waits out the repeat interval
        mLastPulseTime = now;
        if (!mSink->sendHapticImpulse(hand, strength, mParams.duration)) {
            LOG_ERROR("BalanceHaptics: %s controller rejected impulse",
                      hand == Hand::Left ? "left" : "right");
            return false;
        }

        LOG_VERBOSE("BalanceHaptics: %s pulse strength %.2f offset %.3f",
                    hand == Hand::Left ? "left" : "right", strength, offset);
        return true;
    }

    /// Warning pulse on both hands ahead of a disruption
    void warn(float strength, float duration) {
        if (!mSink)
            return;
        bool left = mSink->sendHapticImpulse(Hand::Left, strength, duration);
        bool right = mSink->sendHapticImpulse(Hand::Right, strength, duration);
        if (!left || !right)
            LOG_ERROR("BalanceHaptics: warning pulse not delivered (left=%d right=%d)",
                      left ? 1 : 0, right ? 1 : 0);
    }

    /// Map |offset| in (deadband, 1] onto [minStrength, maxStrength]
    float pulseStrength(float offset) const {
        float mag = std::fabs(offset);
        float u = clamp01((mag - CENTRE_DEADBAND) / (1.0f - CENTRE_DEADBAND));
        return lerp(mParams.minStrength, mParams.maxStrength, u);
    }

    /// Rider detached: forget pulse timing
    void reset() {
        mLastPulseTime = NEVER;
        mLastSide = BalanceSide::Centered;
    }

    const HapticParams &getParams() const { return mParams; }
    BalanceSide getLastSide() const { return mLastSide; }

private:
    IHapticSink *mSink;
    HapticParams mParams;

    float mLastPulseTime = NEVER;
    BalanceSide mLastSide = BalanceSide::Centered;
};

} // namespace Tightrope

#endif // __BALANCEHAPTICS_H
