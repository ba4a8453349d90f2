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

/// @file TightropeMath.h
/// @brief Central math header: GLM-backed type aliases for Tightrope.
///
/// All simulation code should include this header for Vector3 and Quaternion.
/// The underlying implementation is GLM (MIT license).
///
/// Coordinate convention matches the tracking stream: Y is up, the XZ plane
/// is horizontal. Distances are metres, angles degrees unless noted.

#pragma once

// GLM experimental extensions (gtx/) are stable and well-tested; the define
// silences the "may change in the future" compile-time warning.
#define GLM_ENABLE_EXPERIMENTAL

#include <algorithm>
#include <cmath>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtx/norm.hpp>

namespace Tightrope {

// --- Core type aliases ---

using Vector3    = glm::vec3;
using Quaternion = glm::quat;   // Constructor order: (w, x, y, z)

/// World up axis.
static constexpr float UP_X = 0.0f;
static constexpr float UP_Y = 1.0f;
static constexpr float UP_Z = 0.0f;

inline Vector3 worldUp() { return Vector3(UP_X, UP_Y, UP_Z); }

/// Vectors shorter than this are treated as degenerate (no direction).
static constexpr float DIRECTION_EPSILON = 1e-4f;

inline float clamp01(float v) { return std::min(std::max(v, 0.0f), 1.0f); }

inline float clampSigned(float v) { return std::min(std::max(v, -1.0f), 1.0f); }

/// Unclamped-t lerp for scalars (t is clamped by callers where needed).
inline float lerp(float a, float b, float t) { return a + (b - a) * t; }

/// Single-pole smoothing step: v += (target - v) * min(1, dt * rate).
/// Never overshoots the target for non-negative dt and rate.
inline float smoothToward(float current, float target, float dt, float rate) {
    float alpha = std::min(1.0f, std::max(dt * rate, 0.0f));
    return current + (target - current) * alpha;
}

/// Project v onto the horizontal plane (drop the up component).
inline Vector3 projectOnHorizontal(const Vector3 &v) {
    return Vector3(v.x, 0.0f, v.z);
}

/// Angle in degrees between v and its horizontal projection.
/// Returns a negative value for a degenerate (near zero) vector so callers
/// can decide how to score it.
inline float angleFromHorizontal(const Vector3 &v) {
    float len = glm::length(v);
    if (len < DIRECTION_EPSILON)
        return -1.0f;

    float horiz = glm::length(projectOnHorizontal(v));
    // atan2 is well defined for a purely vertical vector (horiz == 0 -> 90°)
    return glm::degrees(std::atan2(std::fabs(v.y), horiz));
}

/// Distance between two points measured in the horizontal plane only.
inline float planarDistance(const Vector3 &a, const Vector3 &b) {
    return glm::length(projectOnHorizontal(a - b));
}

} // namespace Tightrope
