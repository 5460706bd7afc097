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
#include <optional>
#include <vector>

#include "render_settings.h"

// Host values captured on the first Apply of a session
struct SavedRenderState {
    float lodBias = 1.0f;
    int maxLodLevel = 0;
    float farClip = 0.0f;
    std::vector<float> cullDistances;
};

// Scales LOD bias and draw distances with optic magnification and puts the
// original values back afterwards.
//
// Idle --Apply--> Applied (snapshot taken)
// Applied --Apply--> Applied (recomputed from the same snapshot)
// Applied --Restore--> Idle (snapshot written back)
// Idle --Restore--> Idle (no-op)
class RenderParameterApplier {
public:
    explicit RenderParameterApplier(IRenderSettings& settings);
    ~RenderParameterApplier();

    RenderParameterApplier(const RenderParameterApplier&) = delete;
    RenderParameterApplier& operator=(const RenderParameterApplier&) = delete;

    void Apply(float magnification, std::optional<float> providerFarClip = std::nullopt);
    void Restore();

    bool IsApplied() const { return m_saved.has_value(); }
    const SavedRenderState* Saved() const { return m_saved ? &*m_saved : nullptr; }

private:
    IRenderSettings& m_settings;
    std::optional<SavedRenderState> m_saved;
};
