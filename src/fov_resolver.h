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
#include <cstdint>
#include <optional>

#include "error_types.h"
#include "provider_registry.h"
#include "scene_graph.h"

enum class FovSource : uint8_t {
    None = 0,
    ScrollOverride,   // User scroll-zoom override
    ZoomHandler,      // Tier 1: live zoom handler on the optic
    CameraData,       // Tier 2: discovered camera-data provider
    StructuralScan,   // Tier 3: any FOV-bearing component on the optic's variant
    Manual,           // Configured fallback
};

const char* FovSource_Name(FovSource src);

struct FovResolution {
    float rawFov = 0.0f;   // Full-angle degrees, 0 = unresolved
    FovSource source = FovSource::None;

    bool Resolved() const;
};

// Priority-ordered FOV discovery for the active optic. Every tier is isolated:
// a failing tier yields no value and the next one runs.
class FovResolver {
public:
    explicit FovResolver(ProviderRegistry& registry);

    FovResolver(const FovResolver&) = delete;
    FovResolver& operator=(const FovResolver&) = delete;

    FovResolution Resolve(const SceneNode* optic);

    // Raw scope FOV in degrees, 0 when no tier produced a confident value
    float ResolveRawFov(const SceneNode* optic) { return Resolve(optic).rawFov; }

    // Far clip of the optic's camera-data provider, if one is bound and found
    std::optional<float> ProviderFarClip(const SceneNode* optic);

    // Individual tiers, half-angle already doubled
    LookupResult<float> FromZoomHandler(const SceneNode& optic) const;
    LookupResult<float> FromCameraData(const SceneNode& optic);
    LookupResult<float> FromStructuralScan(const SceneNode& optic);

private:
    ProviderRegistry& m_registry;
};
