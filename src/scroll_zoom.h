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

#include "scene_graph.h"
#include "scopeview_config.h"

struct ZoomConfig;

// Scroll-wheel zoom override for variable-zoom optics. Works in full-angle
// scope FOV space, same convention as FovResolver.
class ScrollZoom {
public:
    // Native FOV range from the optic's zoom handler. Runs once per optic
    // session; a missing or degenerate range marks the optic as fixed.
    void DiscoverRange(const SceneNode& optic);
    bool RangeDiscovered() const { return m_rangeDiscovered; }
    bool IsVariableZoom() const { return m_isVariableZoom; }

    // Latest native FOV. While an override is active, a change larger than
    // kModeSwitchEpsilon is a mode switch and cancels the override.
    void ObserveNativeFov(float scopeFov);

    // Scroll up (> 0) zooms in. Returns true when the override changed.
    bool HandleScroll(float scrollDelta, const ZoomConfig& config);

    // Override FOV, 0 when inactive
    float EffectiveScopeFov() const;
    bool IsActive() const { return m_active && m_overrideFov > 0.0f; }

    float NativeFov() const { return m_nativeFov; }
    float NativeMinFov() const { return m_nativeMinFov; }
    float NativeMaxFov() const { return m_nativeMaxFov; }

    void Reset();

private:
    float m_overrideFov = 0.0f;
    bool m_active = false;
    float m_nativeFov = optic_config::kReferenceFov;
    float m_nativeMinFov = 1.0f;
    float m_nativeMaxFov = optic_config::kReferenceFov;
    bool m_rangeDiscovered = false;
    bool m_isVariableZoom = false;
    float m_lastNativeFov = 0.0f;
};
