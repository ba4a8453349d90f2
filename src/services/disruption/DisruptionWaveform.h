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

#ifndef __DISRUPTIONWAVEFORM_H
#define __DISRUPTIONWAVEFORM_H

#include <cmath>

#include "TightropeMath.h"

namespace Tightrope {

/// Perturbation waveform kinds
enum class DisruptionType {
    Gust,         // sharp push, linear fade-out
    Drift,        // slow half-sine lean
    Oscillation,  // sinusoidal sway with linear fade-out
    NumTypes
};

inline const char *disruptionTypeName(DisruptionType type) {
    switch (type) {
    case DisruptionType::Gust:        return "gust";
    case DisruptionType::Drift:       return "drift";
    case DisruptionType::Oscillation: return "oscillation";
    default:                          return "none";
    }
}

/// One in-flight disruption. Plain data; the generator advances it by
/// evaluating the envelope at (now - startTime) each tick.
struct DisruptionEvent {
    DisruptionType type = DisruptionType::Gust;
    float direction = 1.0f;   // -1 pushes the left side down, +1 the right side
    float strength  = 0.0f;   // gust/drift peak or oscillation amplitude
    float duration  = 0.0f;   // seconds
    float frequency = 0.0f;   // Hz, oscillation only
    float startTime = 0.0f;   // sim time at ACTIVE entry
};

/// Strength contribution of an event `elapsed` seconds after it started
/// (direction not applied). Zero outside [0, duration].
inline float disruptionStrengthAt(const DisruptionEvent &ev, float elapsed) {
    if (ev.duration <= 0.0f || elapsed < 0.0f || elapsed > ev.duration)
        return 0.0f;

    float t = elapsed / ev.duration;

    switch (ev.type) {
    case DisruptionType::Gust:
        return ev.strength * (1.0f - t);
    case DisruptionType::Drift:
        return ev.strength * std::sin(t * glm::pi<float>());
    case DisruptionType::Oscillation: {
        float wave = std::sin(elapsed * ev.frequency * 2.0f * glm::pi<float>());
        return ev.strength * wave * (1.0f - t);
    }
    default:
        return 0.0f;
    }
}

} // namespace Tightrope

#endif // __DISRUPTIONWAVEFORM_H
