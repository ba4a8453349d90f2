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
 *    PoseSample / IPoseSource: the tracking boundary. The host (XR runtime,
 *    replay file, scripted driver) produces one PoseSample per tick; the
 *    simulation never talks to devices directly.
 *
 *****************************************************************************/

#ifndef __POSESAMPLE_H
#define __POSESAMPLE_H

#include "TightropeMath.h"

namespace Tightrope {

/// Which hand a controller or haptic request refers to
enum class Hand {
    Left,
    Right
};

/// One tracked device: position plus pointing direction
struct TrackedPose {
    Vector3 position{0.0f};
    Vector3 forward{0.0f, 0.0f, 1.0f};
    bool tracked = true;   // false when the device dropped out this tick
};

/// Single time-stamped snapshot of head and both controllers.
/// Produced every tick; nothing holds on to it past the tick.
struct PoseSample {
    float time = 0.0f;     // host time stamp (seconds)
    TrackedPose head;
    TrackedPose left;
    TrackedPose right;

    bool isComplete() const { return head.tracked && left.tracked && right.tracked; }

    const TrackedPose &hand(Hand h) const { return h == Hand::Left ? left : right; }
};

/// Pose stream supplied by the host
class IPoseSource {
public:
    virtual ~IPoseSource() = default;

    /// Sample the devices at time `now`
    virtual PoseSample sample(float now) = 0;
};

} // namespace Tightrope

#endif // __POSESAMPLE_H
