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
#include <span>
#include <vector>

// Host global quality settings and active camera parameters
class IRenderSettings {
public:
    virtual ~IRenderSettings() = default;

    // Global quality
    virtual float GetLodBias() const = 0;
    virtual void SetLodBias(float bias) = 0;
    virtual int GetMaxLodLevel() const = 0;
    virtual void SetMaxLodLevel(int level) = 0;

    // Active camera. Index into the cull distances is the layer, 0 = unlimited.
    virtual float GetFarClipPlane() const = 0;
    virtual void SetFarClipPlane(float distance) = 0;
    virtual std::vector<float> GetLayerCullDistances() const = 0;
    virtual void SetLayerCullDistances(std::span<const float> distances) = 0;
};
