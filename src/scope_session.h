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
#include <string>

#include "config_manager.h"
#include "fov_resolver.h"
#include "provider_registry.h"
#include "render_applier.h"
#include "render_settings.h"
#include "scene_graph.h"
#include "scroll_zoom.h"
#include "stabilization_filter.h"

struct ScopeDiagnostics {
    std::string activeOptic;
    float scopeFov = 0.0f;
    FovSource source = FovSource::None;
    float magnification = 1.0f;
    DiscoveryMethod discovery = DiscoveryMethod::None;
    bool renderApplied = false;
    bool stabilizerInitialized = false;
    float lensDelta = 0.0f;
};

// Long-lived context for one player view. Owns the provider cache, the saved
// render state and the stabilizer. The host drives it from its optic events
// and must call OnOpticExit before destroying the active optic node.
class ScopeSession {
public:
    ScopeSession(const ITypeCatalog& catalog, IRenderSettings& settings, const ScopeViewConfig& config);
    ~ScopeSession();

    ScopeSession(const ScopeSession&) = delete;
    ScopeSession& operator=(const ScopeSession&) = delete;

    void SetConfig(const ScopeViewConfig& config) { m_config = config; }
    const ScopeViewConfig& Config() const { return m_config; }

    // --- Optic lifecycle ---
    void OnOpticEnter(const SceneNode& optic);
    void OnModeSwitch(const SceneNode& optic);
    void OnOpticExit();

    bool IsScoped() const { return m_activeOptic != nullptr; }
    const SceneNode* ActiveOptic() const { return m_activeOptic; }

    // --- Per-frame ---
    // Main camera FOV for the current optic, or the configured manual FOV
    float ComputeZoomedFov(float baseFov);
    float CurrentMagnification();
    // Returns true when the scroll override changed (render parameters re-applied)
    bool OnScroll(float scrollDelta);
    void LateUpdate(const Pose& camera, const Pose& lens, const Pose& optic, float unscaledDeltaTime);

    ScopeDiagnostics Diagnostics() const;

    // Component access for hosts and tests
    ProviderRegistry& Registry() { return m_registry; }
    FovResolver& Resolver() { return m_resolver; }
    RenderParameterApplier& Applier() { return m_applier; }
    const StabilizationFilter& Stabilizer() const { return m_stabilizer; }
    const ScrollZoom& Zoom() const { return m_scrollZoom; }

private:
    FovResolution ResolveScopeFov();
    void ApplyRenderParameters();

    ScopeViewConfig m_config;
    ProviderRegistry m_registry;
    FovResolver m_resolver;
    RenderParameterApplier m_applier;
    StabilizationFilter m_stabilizer;
    ScrollZoom m_scrollZoom;

    const SceneNode* m_activeOptic = nullptr;
    FovResolution m_lastResolution;
    float m_lastLoggedFov = 0.0f;
};
