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
#include "stabilization_filter.h"
#include "scopeview_config.h"

#include <algorithm>
#include <cmath>

float StabilizationFilter::Alpha(float unscaledDeltaTime) {
    float dt = std::isfinite(unscaledDeltaTime) ? unscaledDeltaTime : 0.0f;
    dt = std::max(stabilizer_config::kMinDeltaTime, dt);
    return 1.0f - std::exp(-dt / stabilizer_config::kTauPos);
}

void StabilizationFilter::Reset() {
    m_initialized = false;
    m_lensCamSmoothed = {};
    m_opticRotSmoothed = {};
    m_lensDeltaCam = 0.0f;
}

void StabilizationFilter::Update(const Pose& camera, const Pose& lens, const Pose& optic,
                                 float unscaledDeltaTime) {
    const Vec3 lensCam = InverseTransformPoint(camera, lens.position);

    // First frame: adopt raw values, no startup snap
    if (!m_initialized) {
        m_initialized = true;
        m_lensCamSmoothed = lensCam;
        m_opticRotSmoothed = optic.rotation;
        m_lensDeltaCam = 0.0f;
        return;
    }

    const Vec3 d = lensCam - m_lensCamSmoothed;
    m_lensDeltaCam = Length3(d);

    constexpr float kDeadzoneSq = stabilizer_config::kDeadzone * stabilizer_config::kDeadzone;
    if (SqrLength3(d) > kDeadzoneSq) {
        m_lensCamSmoothed = Lerp3(m_lensCamSmoothed, lensCam, Alpha(unscaledDeltaTime));
    }

    // Rotation is never smoothed, it tracks the optic every frame
    m_opticRotSmoothed = optic.rotation;
}
