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
#include "fov_resolver.h"

#include "logger.h"
#include "scene_query.h"
#include "scene_walker.h"
#include "scopeview_config.h"

#include <cmath>
#include <exception>

using cpp26::reflect::FieldInfo;
using cpp26::reflect::FieldType;

namespace {

bool IsConfident(float fov) {
    return std::isfinite(fov) && fov > optic_config::kMinConfidentFov;
}

bool IsPlausible(float fov) {
    return IsConfident(fov) && fov < optic_config::kMaxPlausibleFov;
}

} // anonymous namespace

const char* FovSource_Name(FovSource src) {
    switch (src) {
        case FovSource::None:           return "None";
        case FovSource::ScrollOverride: return "ScrollOverride";
        case FovSource::ZoomHandler:    return "ZoomHandler";
        case FovSource::CameraData:     return "CameraData";
        case FovSource::StructuralScan: return "StructuralScan";
        case FovSource::Manual:         return "Manual";
        default:                        return "Unknown";
    }
}

bool FovResolution::Resolved() const { return IsConfident(rawFov); }

FovResolver::FovResolver(ProviderRegistry& registry) : m_registry(registry) {}

FovResolution FovResolver::Resolve(const SceneNode* optic) {
    if (!optic) return {};

    // --- Tier 1: live zoom handler ---
    if (auto fov = FromZoomHandler(*optic)) {
        return {*fov, FovSource::ZoomHandler};
    } else {
        LOG_DEBUG("[FovResolver] Zoom handler: {}", to_string(fov.error()));
    }

    // --- Tier 2: camera-data provider ---
    if (auto fov = FromCameraData(*optic)) {
        return {*fov, FovSource::CameraData};
    } else {
        LOG_DEBUG("[FovResolver] Camera data: {}", to_string(fov.error()));
    }

    // --- Tier 3: structural scan ---
    if (auto fov = FromStructuralScan(*optic)) {
        return {*fov, FovSource::StructuralScan};
    } else {
        LOG_DEBUG("[FovResolver] Structural scan: {}", to_string(fov.error()));
    }

    return {};
}

LookupResult<float> FovResolver::FromZoomHandler(const SceneNode& optic) const {
    try {
        const IZoomHandler* handler = SceneQuery_CapabilityInSelfOrAncestors<IZoomHandler>(optic);
        if (!handler) handler = SceneQuery_CapabilityInSelfOrDescendants<IZoomHandler>(optic);
        if (!handler) return std::unexpected(LookupError::NoMatch);

        float fov = handler->FieldOfView();
        if (!IsConfident(fov)) return std::unexpected(LookupError::OutOfRange);
        return fov * optic_config::kHalfAngleScale;
    } catch (const std::exception& ex) {
        LOG_DEBUG("[FovResolver] Zoom handler query threw: {}", ex.what());
        return std::unexpected(LookupError::QueryFailed);
    }
}

LookupResult<float> FovResolver::FromCameraData(const SceneNode& optic) {
    const ProviderBinding* binding = m_registry.Resolve();
    if (!binding) return std::unexpected(LookupError::NoBinding);

    auto hit = SceneWalker_FindProvider(optic, *binding);
    if (!hit) return std::unexpected(hit.error());

    try {
        auto fov = binding->ReadFov(*hit->component);
        if (!fov) return fov;
        if (!IsConfident(*fov)) return std::unexpected(LookupError::OutOfRange);

        LOG_DEBUG("[FovResolver] Camera data ({}): FOV={:.2f}", ProviderLocation_Name(hit->location), *fov);
        return *fov * optic_config::kHalfAngleScale;
    } catch (const std::exception& ex) {
        LOG_DEBUG("[FovResolver] Camera data read threw: {}", ex.what());
        return std::unexpected(LookupError::QueryFailed);
    }
}

LookupResult<float> FovResolver::FromStructuralScan(const SceneNode& optic) {
    try {
        const SceneNode& root = Hierarchy_FindScopeRoot(optic);

        const Component* match = nullptr;
        const FieldInfo* matchField = nullptr;
        float matchFov = 0.0f;

        SceneQuery_ForEachComponent(root, [&](const Component& c) {
            const FieldInfo* field = c.Type().getField(shape_config::kFovField, FieldType::Float);
            if (!field) return true;

            float fov = field->getFloat(c.Instance());
            if (!IsPlausible(fov)) return true;

            // Only the optic's own variant, never "any match"
            if (!Hierarchy_IsSameVariant(c.Owner(), optic)) return true;

            match = &c;
            matchField = field;
            matchFov = fov;
            return false;
        });

        if (!match || !matchField) return std::unexpected(LookupError::NoMatch);

        LOG_INFO("[FovResolver] Structural scan '{}' type={} FOV={:.2f}",
                 match->Owner().Name(), match->Type().name, matchFov);

        if (auto binding = ProviderBinding::FromType(match->Type())) {
            m_registry.Adopt(*binding);
        }
        return matchFov * optic_config::kHalfAngleScale;
    } catch (const std::exception& ex) {
        LOG_DEBUG("[FovResolver] Structural scan threw: {}", ex.what());
        return std::unexpected(LookupError::QueryFailed);
    }
}

std::optional<float> FovResolver::ProviderFarClip(const SceneNode* optic) {
    if (!optic) return std::nullopt;

    const ProviderBinding* binding = m_registry.Resolve();
    if (!binding || !binding->farClip) return std::nullopt;

    auto hit = SceneWalker_FindProvider(*optic, *binding);
    if (!hit) return std::nullopt;

    try {
        auto farClip = binding->ReadFarClip(*hit->component);
        if (farClip && std::isfinite(*farClip) && *farClip > 0.0f) return *farClip;
    } catch (const std::exception& ex) {
        LOG_DEBUG("[FovResolver] Far clip read threw: {}", ex.what());
    }
    return std::nullopt;
}
