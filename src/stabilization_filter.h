/*
 * Copyright (C) 2026 acerthyracer
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once

#include "transform_math.h"

// Smooths the optic lens position in camera space to hide sub-pixel jitter.
// Call Update once per frame, after camera motion for the frame is final.
class StabilizationFilter {
public:
    void Reset();

    // unscaledDeltaTime: real frame time in seconds, independent of game time scale
    void Update(const Pose& camera, const Pose& lens, const Pose& optic, float unscaledDeltaTime);

    bool IsInitialized() const { return m_initialized; }
    const Vec3& LensCamSmoothed() const { return m_lensCamSmoothed; }
    const Quat& OpticRotSmoothed() const { return m_opticRotSmoothed; }
    // Raw-to-smoothed distance of the last update (diagnostics)
    float LensDeltaCam() const { return m_lensDeltaCam; }

    // Smoothing coefficient for one frame: 1 - exp(-dt / tau)
    static float Alpha(float unscaledDeltaTime);

private:
    bool m_initialized = false;
    Vec3 m_lensCamSmoothed;
    Quat m_opticRotSmoothed;
    float m_lensDeltaCam = 0.0f;
};
