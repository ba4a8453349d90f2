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
 *    RopePath: straight line between two anchors with a vertical droop
 *    term: pos(t) = lerp(start, end, t) - up * sagCurve(t) * maxSag.
 *    Catenary-like look without any rope simulation.
 *
 *****************************************************************************/

#ifndef __ROPEPATH_H
#define __ROPEPATH_H

#include "ResponseCurve.h"
#include "TightropeMath.h"

namespace Tightrope {

class RopePath {
public:
    /// Half-width of the finite-difference window used for the tangent
    static constexpr float TANGENT_DELTA = 0.01f;

    RopePath() = default;

    RopePath(const Vector3 &start, const Vector3 &end,
             const ResponseCurve &sagCurve = ResponseCurve::sag(), float maxSag = 2.0f)
        : mStart(start), mEnd(end), mSagCurve(sagCurve), mMaxSag(maxSag) {}

    /// Straight-line anchor distance (the sag is ignored for travel speed)
    float length() const { return glm::length(mEnd - mStart); }

    /// Anchors closer than DIRECTION_EPSILON cannot be travelled
    bool isDegenerate() const { return length() < DIRECTION_EPSILON; }

    Vector3 positionAt(float t) const {
        t = clamp01(t);
        Vector3 base = glm::mix(mStart, mEnd, t);
        return base - worldUp() * (mSagCurve.evaluate(t) * mMaxSag);
    }

    /// Unit tangent at t; zero vector on a degenerate path
    Vector3 directionAt(float t) const {
        float t1 = clamp01(t - TANGENT_DELTA);
        float t2 = clamp01(t + TANGENT_DELTA);

        Vector3 d = positionAt(t2) - positionAt(t1);
        float len = glm::length(d);
        if (len < DIRECTION_EPSILON)
            return Vector3(0.0f);
        return d / len;
    }

    /// Plank orientation at t: looks along the tangent with world up.
    /// Identity on a degenerate path.
    Quaternion orientationAt(float t) const {
        Vector3 dir = directionAt(t);
        if (glm::length2(dir) < DIRECTION_EPSILON)
            return Quaternion(1.0f, 0.0f, 0.0f, 0.0f);
        // vertical tangent: look-at with world up is undefined
        if (std::fabs(glm::dot(dir, worldUp())) > 0.999f)
            return Quaternion(1.0f, 0.0f, 0.0f, 0.0f);
        // quatLookAt maps -Z onto dir; the plank model faces -Z
        return glm::quatLookAt(dir, worldUp());
    }

    const Vector3 &getStart() const { return mStart; }
    const Vector3 &getEnd() const { return mEnd; }
    const ResponseCurve &getSagCurve() const { return mSagCurve; }
    float getMaxSag() const { return mMaxSag; }

private:
    Vector3 mStart{0.0f};
    Vector3 mEnd{0.0f, 0.0f, 20.0f};
    ResponseCurve mSagCurve = ResponseCurve::sag();
    float mMaxSag = 2.0f;
};

} // namespace Tightrope

#endif // __ROPEPATH_H
