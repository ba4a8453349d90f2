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

#ifndef __DIFFICULTYRAMP_H
#define __DIFFICULTYRAMP_H

#include <algorithm>

#include "TightropeMath.h"
#include "disruption/DisruptionGenerator.h"
#include "logger.h"

namespace Tightrope {

/// Tunables for difficulty progression and the grace period
struct DifficultyParams {
    bool  enabled           = true;
    float increaseRate      = 0.1f;   // multiplier added per interval
    float increaseInterval  = 10.0f;  // seconds
    float maxMultiplier     = 3.0f;

    float gracePeriodAfterBalance = 3.0f;  // seconds without disruptions after regaining balance
    float baseDisruptionChance    = 0.5f;
    float disruptionChanceMultiplier = 1.5f; // how strongly difficulty raises the chance
};

/// Difficulty state: monotonic while attached
struct DifficultyState {
    float multiplier       = 1.0f;
    float lastIncreaseTime = 0.0f;
};

/// Scales disruption strength up and gaps down as the ride goes on.
/// Derived generator parameters are always recomputed from the generator's
/// base values, so repeated ramps never compound.
class DifficultyRamp {
public:
    explicit DifficultyRamp(const DifficultyParams &params = DifficultyParams())
        : mParams(params) {}

    /// Rider attached (or sim reset): multiplier back to 1, timer restarts
    void reset(float now, DisruptionGenerator *generator) {
        mState.multiplier = 1.0f;
        mState.lastIncreaseTime = now;
        if (generator)
            applyTo(*generator);
    }

    /// Per attached tick. Returns true when the multiplier stepped up.
    bool step(float now, DisruptionGenerator *generator) {
        if (now - mState.lastIncreaseTime < mParams.increaseInterval)
            return false;

        mState.lastIncreaseTime = now;

        float previous = mState.multiplier;
        mState.multiplier = std::min(mState.multiplier + mParams.increaseRate,
                                     std::max(mParams.maxMultiplier, 1.0f));
        // rate may be configured negative; the multiplier never goes down
        mState.multiplier = std::max(mState.multiplier, previous);

        if (generator)
            applyTo(*generator);

        if (mState.multiplier > previous) {
            LOG_INFO("DifficultyRamp: difficulty increased to %.2fx", mState.multiplier);
            return true;
        }
        return false;
    }

    /// Push scaled strength / gap / chance values into the generator
    void applyTo(DisruptionGenerator &generator) const {
        generator.setParams(scaledParams(generator.getBaseParams()));
    }

    /// Base parameters scaled by the current multiplier
    DisruptionParams scaledParams(const DisruptionParams &base) const {
        float m = mState.multiplier;
        DisruptionParams p = base;

        // Stronger disruptions
        p.gustMinStrength      = base.gustMinStrength * m;
        p.gustMaxStrength      = base.gustMaxStrength * m;
        p.driftMinStrength     = base.driftMinStrength * m;
        p.driftMaxStrength     = base.driftMaxStrength * m;
        p.oscillationAmplitude = base.oscillationAmplitude * m;

        // More frequent disruptions
        p.minTimeBetween = base.minTimeBetween / m;
        p.maxTimeBetween = base.maxTimeBetween / m;

        p.disruptionChance = currentChance();
        return p;
    }

    /// chance = clamp01(base * (1 + (m - 1) * chanceMultiplier))
    float currentChance() const {
        return clamp01(mParams.baseDisruptionChance *
                       (1.0f + (mState.multiplier - 1.0f) * mParams.disruptionChanceMultiplier));
    }

    const DifficultyParams &getParams() const { return mParams; }
    const DifficultyState &getState() const { return mState; }
    float getMultiplier() const { return mState.multiplier; }

private:
    DifficultyParams mParams;
    DifficultyState mState;
};

} // namespace Tightrope

#endif // __DIFFICULTYRAMP_H
