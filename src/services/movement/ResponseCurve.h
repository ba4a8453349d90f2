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

#ifndef __RESPONSECURVE_H
#define __RESPONSECURVE_H

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace Tightrope {

/// Piecewise-linear 1D curve defined by (t, value) keyframes.
/// Evaluation outside the key range holds the first/last value.
/// Used for the balance → speed mapping and the rope sag profile.
class ResponseCurve {
public:
    typedef std::pair<float, float> Key;

    ResponseCurve() { mKeys.emplace_back(0.0f, 0.0f); mKeys.emplace_back(1.0f, 1.0f); }

    explicit ResponseCurve(std::vector<Key> keys) : mKeys(std::move(keys)) {
        if (mKeys.empty())
            mKeys.emplace_back(0.0f, 0.0f);
        std::sort(mKeys.begin(), mKeys.end(),
                  [](const Key &a, const Key &b) { return a.first < b.first; });
    }

    float evaluate(float t) const {
        if (t <= mKeys.front().first)
            return mKeys.front().second;
        if (t >= mKeys.back().first)
            return mKeys.back().second;

        for (size_t i = 1; i < mKeys.size(); ++i) {
            const Key &b = mKeys[i];
            if (t <= b.first) {
                const Key &a = mKeys[i - 1];
                float span = b.first - a.first;
                if (span <= 0.0f)
                    return b.second;
                float u = (t - a.first) / span;
                return a.second + (b.second - a.second) * u;
            }
        }
        return mKeys.back().second;
    }

    const std::vector<Key> &getKeys() const { return mKeys; }

    // ── Presets ──

    /// Identity on [0,1]
    static ResponseCurve linear() { return ResponseCurve(); }

    /// Smoothstep-shaped ease from (0,0) to (1,1), sampled at 8 segments
    static ResponseCurve easeInOut() {
        std::vector<Key> keys;
        for (int i = 0; i <= 8; ++i) {
            float t = static_cast<float>(i) / 8.0f;
            keys.emplace_back(t, t * t * (3.0f - 2.0f * t));
        }
        return ResponseCurve(std::move(keys));
    }

    /// Rope droop profile: 0 at both anchors, 1 at mid-span (4t(1-t)),
    /// sampled at 16 segments
    static ResponseCurve sag() {
        std::vector<Key> keys;
        for (int i = 0; i <= 16; ++i) {
            float t = static_cast<float>(i) / 16.0f;
            keys.emplace_back(t, 4.0f * t * (1.0f - t));
        }
        return ResponseCurve(std::move(keys));
    }

    /// Flat zero (no droop)
    static ResponseCurve flat() {
        return ResponseCurve({Key(0.0f, 0.0f), Key(1.0f, 0.0f)});
    }

    /// Look up a preset by name ("linear", "ease_in_out", "sag", "flat").
    /// Returns false and leaves out untouched for unknown names.
    static bool fromPreset(const std::string &name, ResponseCurve &out) {
        if (name == "linear")
            out = linear();
        else if (name == "ease_in_out")
            out = easeInOut();
        else if (name == "sag")
            out = sag();
        else if (name == "flat")
            out = flat();
        else
            return false;
        return true;
    }

private:
    std::vector<Key> mKeys;   // sorted by t, never empty
};

} // namespace Tightrope

#endif // __RESPONSECURVE_H
