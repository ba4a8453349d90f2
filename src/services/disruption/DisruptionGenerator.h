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
 *    DisruptionGenerator: schedules and plays balance perturbations.
 *
 *    State machine, stepped once per tick:
 *
 *      Idle ──(due, no grace, balanced, roll ok)──► Warning ──(warningTime)──► Active
 *        ▲                                                                      │
 *        └──────────────────────(duration elapsed, reschedule)──────────────────┘
 *
 *    Warning is skipped when provideWarning is off. A failed roll, a rider
 *    who is already unbalanced, or an empty type set reschedules without
 *    firing. While the grace period is active the generator simply waits
 *    (the due time is kept, so it fires as soon as grace ends).
 *
 *    While Active, each tick adds strength(t) * dt * direction to the
 *    scorer's smoothed offset; the scorer's filter then absorbs it.
 *
 *****************************************************************************/

#ifndef __DISRUPTIONGENERATOR_H
#define __DISRUPTIONGENERATOR_H

#include <algorithm>
#include <functional>
#include <random>
#include <vector>

#include "DisruptionWaveform.h"
#include "balance/BalanceScorer.h"
#include "logger.h"

namespace Tightrope {

/// Tunables for the generator. The difficulty ramp rescales the strength,
/// gap and chance fields from a copy of the base values.
struct DisruptionParams {
    bool  enabled = true;

    float minTimeBetween = 5.0f;    // seconds
    float maxTimeBetween = 15.0f;   // seconds

    bool  enableGusts        = true;
    bool  enableDrift        = true;
    bool  enableOscillations = true;

    float gustMinStrength = 0.2f;
    float gustMaxStrength = 0.6f;
    float gustDuration    = 0.3f;

    float driftMinStrength = 0.1f;
    float driftMaxStrength = 0.3f;
    float driftDuration    = 2.0f;

    float oscillationAmplitude = 0.15f;
    float oscillationFrequency = 1.0f;
    float oscillationDuration  = 4.0f;

    bool  provideWarning        = true;
    float warningTime           = 0.5f;
    float warningHapticStrength = 0.2f;
    float warningHapticDuration = 0.2f;

    float disruptionChance = 1.0f;  // probability a due disruption actually fires
};

enum class DisruptionPhase {
    Idle,
    Warning,
    Active
};

inline const char *disruptionPhaseName(DisruptionPhase phase) {
    switch (phase) {
    case DisruptionPhase::Idle:    return "idle";
    case DisruptionPhase::Warning: return "warning";
    case DisruptionPhase::Active:  return "active";
    }
    return "?";
}

using DisruptionWarningCallback = std::function<void(DisruptionType type)>;
using DisruptionStartedCallback = std::function<void(const DisruptionEvent &ev)>;
/// interrupted = true when stop() cut the disruption short
using DisruptionEndedCallback = std::function<void(const DisruptionEvent &ev, bool interrupted)>;

class DisruptionGenerator {
public:
    /// The scorer receives the perturbation; rng must outlive the generator.
    DisruptionGenerator(BalanceScorer &scorer, std::mt19937 &rng,
                        const DisruptionParams &params = DisruptionParams())
        : mScorer(scorer), mRng(rng), mParams(params), mBaseParams(params) {}

    // ── Lifecycle ──

    /// Arm the scheduler at `now` (rider attached). Any in-flight disruption
    /// is cancelled first.
    void start(float now) {
        stop();
        scheduleNext(now);
    }

    /// Forcibly terminate any in-flight disruption and return to Idle
    void stop() {
        if (mPhase == DisruptionPhase::Idle)
            return;

        bool wasActive = (mPhase == DisruptionPhase::Active);
        mPhase = DisruptionPhase::Idle;

        if (wasActive) {
            LOG_DEBUG("DisruptionGenerator: %s interrupted", disruptionTypeName(mEvent.type));
            for (const auto &cb : mEndedListeners)
                cb(mEvent, true);
        }
    }

    // ── Per-tick update ──

    /// Advance the state machine. inGracePeriod comes from the owner's
    /// grace bookkeeping.
    void step(float now, float dt, bool inGracePeriod) {
        switch (mPhase) {
        case DisruptionPhase::Idle:
            stepIdle(now, inGracePeriod);
            // a disruption without warning plays from the tick it starts
            if (mPhase == DisruptionPhase::Active)
                stepActive(now, dt);
            break;
        case DisruptionPhase::Warning:
            if (now - mPhaseStartTime < mParams.warningTime)
                break;
            if (inGracePeriod) {
                // the due time stands, so it plays on the first tick after grace
                LOG_VERBOSE("DisruptionGenerator: grace began during warning, deferring %s",
                            disruptionTypeName(mPendingType));
                mPhase = DisruptionPhase::Idle;
                break;
            }
            if (!mScorer.isBalanced()) {
                LOG_VERBOSE("DisruptionGenerator: rider unbalanced after warning, skipping");
                mPhase = DisruptionPhase::Idle;
                scheduleNext(now);
                break;
            }
            beginActive(mPendingType, now);
            stepActive(now, dt);
            break;
        case DisruptionPhase::Active:
            stepActive(now, dt);
            break;
        }
    }

    /// Start a specific waveform immediately (warning phase included when
    /// configured), bypassing schedule, grace and roll. Ignored unless Idle.
    bool trigger(DisruptionType type, float now) {
        if (mPhase != DisruptionPhase::Idle)
            return false;
        begin(type, now);
        return true;
    }

    // ── Parameters ──

    const DisruptionParams &getParams() const { return mParams; }
    const DisruptionParams &getBaseParams() const { return mBaseParams; }

    /// Replace the live parameters (base values are kept)
    void setParams(const DisruptionParams &params) { mParams = params; }

    void setDisruptionChance(float chance) { mParams.disruptionChance = clamp01(chance); }

    /// Undo any difficulty scaling
    void restoreBaseValues() { mParams = mBaseParams; }

    // ── Observers ──

    void addWarningListener(DisruptionWarningCallback cb) { mWarningListeners.push_back(std::move(cb)); }
    void addStartedListener(DisruptionStartedCallback cb) { mStartedListeners.push_back(std::move(cb)); }
    void addEndedListener(DisruptionEndedCallback cb) { mEndedListeners.push_back(std::move(cb)); }

    // ── State access ──

    DisruptionPhase getPhase() const { return mPhase; }
    bool isDisrupting() const { return mPhase != DisruptionPhase::Idle; }
    bool isActive() const { return mPhase == DisruptionPhase::Active; }

    /// The current (or most recent) event; meaningful while Active
    const DisruptionEvent &getEvent() const { return mEvent; }

    float getNextDisruptionTime() const { return mNextDisruptionTime; }

    /// Signed contribution currently being applied (0 unless Active)
    float getCurrentStrength(float now) const {
        if (mPhase != DisruptionPhase::Active)
            return 0.0f;
        return disruptionStrengthAt(mEvent, now - mEvent.startTime) * mEvent.direction;
    }

private:
    void stepIdle(float now, bool inGracePeriod) {
        if (!mParams.enabled || inGracePeriod)
            return;

        if (now < mNextDisruptionTime)
            return;

        if (!rollChance()) {
            LOG_VERBOSE("DisruptionGenerator: roll failed (chance %.2f), rescheduling",
                        mParams.disruptionChance);
            scheduleNext(now);
            return;
        }

        if (!mScorer.isBalanced()) {
            // never kick a rider who is already failing
            LOG_VERBOSE("DisruptionGenerator: rider unbalanced, skipping");
            scheduleNext(now);
            return;
        }

        DisruptionType type;
        if (!pickType(type)) {
            scheduleNext(now);
            return;
        }

        begin(type, now);
    }

    void begin(DisruptionType type, float now) {
        if (mParams.provideWarning && mParams.warningTime > 0.0f) {
            mPhase = DisruptionPhase::Warning;
            mPhaseStartTime = now;
            mPendingType = type;
            LOG_DEBUG("DisruptionGenerator: warning for %s", disruptionTypeName(type));
            for (const auto &cb : mWarningListeners)
                cb(type);
        } else {
            beginActive(type, now);
        }
    }

    void beginActive(DisruptionType type, float now) {
        DisruptionEvent ev;
        ev.type = type;
        ev.startTime = now;

        switch (type) {
        case DisruptionType::Gust:
            ev.direction = randomDirection();
            ev.strength = uniform(mParams.gustMinStrength, mParams.gustMaxStrength);
            ev.duration = mParams.gustDuration;
            break;
        case DisruptionType::Drift:
            ev.direction = randomDirection();
            ev.strength = uniform(mParams.driftMinStrength, mParams.driftMaxStrength);
            ev.duration = mParams.driftDuration;
            break;
        case DisruptionType::Oscillation:
        default:
            // the sinusoid supplies its own sign
            ev.direction = 1.0f;
            ev.strength = mParams.oscillationAmplitude;
            ev.frequency = mParams.oscillationFrequency;
            ev.duration = mParams.oscillationDuration;
            break;
        }

        mEvent = ev;
        mPhase = DisruptionPhase::Active;
        mPhaseStartTime = now;

        LOG_DEBUG("DisruptionGenerator: %s started (strength %.3f dir %+.0f duration %.2fs)",
                  disruptionTypeName(ev.type), ev.strength, ev.direction, ev.duration);

        for (const auto &cb : mStartedListeners)
            cb(mEvent);
    }

    void stepActive(float now, float dt) {
        float elapsed = now - mEvent.startTime;
        if (elapsed >= mEvent.duration) {
            finish(now);
            return;
        }

        float strength = disruptionStrengthAt(mEvent, elapsed);
        mScorer.applyDisruption(strength * dt, mEvent.direction);
    }

    void finish(float now) {
        mPhase = DisruptionPhase::Idle;
        LOG_DEBUG("DisruptionGenerator: %s ended", disruptionTypeName(mEvent.type));
        for (const auto &cb : mEndedListeners)
            cb(mEvent, false);
        scheduleNext(now);
    }

    void scheduleNext(float now) {
        mNextDisruptionTime = now + uniform(mParams.minTimeBetween, mParams.maxTimeBetween);
    }

    bool rollChance() {
        float chance = mParams.disruptionChance;
        if (chance <= 0.0f)
            return false;
        std::uniform_real_distribution<float> dist(0.0f, 1.0f);
        return dist(mRng) <= chance;
    }

    bool pickType(DisruptionType &out) {
        DisruptionType available[3];
        int count = 0;
        if (mParams.enableGusts)        available[count++] = DisruptionType::Gust;
        if (mParams.enableDrift)        available[count++] = DisruptionType::Drift;
        if (mParams.enableOscillations) available[count++] = DisruptionType::Oscillation;

        if (count == 0)
            return false;

        std::uniform_int_distribution<int> dist(0, count - 1);
        out = available[dist(mRng)];
        return true;
    }

    float randomDirection() {
        std::uniform_int_distribution<int> dist(0, 1);
        return dist(mRng) == 0 ? -1.0f : 1.0f;
    }

    float uniform(float a, float b) {
        float lo = std::min(a, b);
        float hi = std::max(a, b);
        if (hi - lo <= 0.0f)
            return lo;
        std::uniform_real_distribution<float> dist(lo, hi);
        return dist(mRng);
    }

    BalanceScorer &mScorer;
    std::mt19937 &mRng;

    DisruptionParams mParams;       // live (difficulty-scaled) values
    DisruptionParams mBaseParams;   // as configured

    DisruptionPhase mPhase = DisruptionPhase::Idle;
    DisruptionType mPendingType = DisruptionType::Gust;  // waveform waiting out its warning
    DisruptionEvent mEvent;
    float mPhaseStartTime = 0.0f;
    float mNextDisruptionTime = 0.0f;

    std::vector<DisruptionWarningCallback> mWarningListeners;
    std::vector<DisruptionStartedCallback> mStartedListeners;
    std::vector<DisruptionEndedCallback> mEndedListeners;
};

} // namespace Tightrope

#endif // __DISRUPTIONGENERATOR_H
