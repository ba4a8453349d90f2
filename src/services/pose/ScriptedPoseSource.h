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
 *    ScriptedPoseSource: procedural stand-in for a tracked rider, used by
 *    the headless driver and tests. The rider holds a T-pose with the head
 *    at shoulderHeight + 0.15 and the hands `separation` apart, pointing
 *    forward (+Z); each scenario perturbs the hand heights.
 *
 *****************************************************************************/

#ifndef __SCRIPTEDPOSESOURCE_H
#define __SCRIPTEDPOSESOURCE_H

#include <cmath>
#include <string>

#include "PoseSample.h"

namespace Tightrope {

enum class PoseScenario {
    Level,      // hands level, arms spread
    Tilt,       // right hand held `amplitude` above the left
    Wobble,     // right-minus-left height oscillates at `frequency`
    Dropout,    // level, but the right controller loses tracking periodically
    Slump       // arms drift together and droop over time
};

/// Parse a scenario name ("level", "tilt", "wobble", "dropout", "slump").
/// Returns false for unknown names.
inline bool parsePoseScenario(const std::string &name, PoseScenario &out) {
    if (name == "level")        out = PoseScenario::Level;
    else if (name == "tilt")    out = PoseScenario::Tilt;
    else if (name == "wobble")  out = PoseScenario::Wobble;
    else if (name == "dropout") out = PoseScenario::Dropout;
    else if (name == "slump")   out = PoseScenario::Slump;
    else return false;
    return true;
}

class ScriptedPoseSource : public IPoseSource {
public:
    explicit ScriptedPoseSource(PoseScenario scenario = PoseScenario::Level)
        : mScenario(scenario) {}

    void setScenario(PoseScenario s) { mScenario = s; }
    void setSeparation(float metres) { mSeparation = metres; }
    void setShoulderHeight(float metres) { mShoulderHeight = metres; }
    void setAmplitude(float metres) { mAmplitude = metres; }
    void setFrequency(float hz) { mFrequency = hz; }

    /// Offset of the rider's origin (moves with the plank in the host)
    void setOrigin(const Vector3 &origin) { mOrigin = origin; }

    PoseSample sample(float now) override {
        PoseSample s;
        s.time = now;

        float half = mSeparation * 0.5f;
        float leftY = mShoulderHeight;
        float rightY = mShoulderHeight;

        switch (mScenario) {
        case PoseScenario::Level:
            break;
        case PoseScenario::Tilt:
            rightY += mAmplitude;
            break;
        case PoseScenario::Wobble: {
            float d = mAmplitude * std::sin(now * mFrequency * 2.0f * glm::pi<float>());
            leftY -= d * 0.5f;
            rightY += d * 0.5f;
            break;
        }
        case PoseScenario::Dropout:
            // 0.5s dropout every 4s
            s.right.tracked = std::fmod(now, 4.0f) < 3.5f;
            break;
        case PoseScenario::Slump: {
            float k = clamp01(now / 20.0f);
            half *= 1.0f - 0.6f * k;
            leftY -= 0.3f * k;
            break;
        }
        }

        s.head.position = mOrigin + Vector3(0.0f, mShoulderHeight + 0.15f, 0.0f);
        s.head.forward = Vector3(0.0f, 0.0f, 1.0f);

        s.left.position = mOrigin + Vector3(-half, leftY, 0.0f);
        s.left.forward = Vector3(0.0f, 0.0f, 1.0f);

        s.right.position = mOrigin + Vector3(half, rightY, 0.0f);
        s.right.forward = Vector3(0.0f, 0.0f, 1.0f);

        return s;
    }

private:
    PoseScenario mScenario;
    Vector3 mOrigin{0.0f};
    float mSeparation = 1.4f;       // hand separation (m)
    float mShoulderHeight = 1.45f;  // hand height above rider origin (m)
    float mAmplitude = 0.1f;        // tilt / wobble magnitude (m)
    float mFrequency = 0.5f;        // wobble frequency (Hz)
};

} // namespace Tightrope

#endif // __SCRIPTEDPOSESOURCE_H
