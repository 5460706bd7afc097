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
#include "scope_session.h"

#include "logger.h"
#include "magnification_math.h"

#include <cmath>
#include <exception>

ScopeSession::ScopeSession(const ITypeCatalog& catalog, IRenderSettings& settings, const ScopeViewConfig& config)
    : m_config(config), m_registry(catalog), m_resolver(m_registry), m_applier(settings) {}

ScopeSession::~ScopeSession() {
    OnOpticExit();
}

// ============================================================================
// Lifecycle
// ============================================================================

void ScopeSession::OnOpticEnter(const SceneNode& optic) {
    if (m_activeOptic == &optic) return;
    if (m_activeOptic) {
        OnModeSwitch(optic);
        return;
    }

    m_activeOptic = &optic;
    m_stabilizer.Reset();
    m_scrollZoom.Reset();
    m_lastLoggedFov = 0.0f;

    LOG_INFO("[ScopeSession] Optic enter: '{}'", optic.Name());
    ApplyRenderParameters();
}

void ScopeSession::OnModeSwitch(const SceneNode& optic) {
    if (!m_activeOptic || m_activeOptic == &optic) return;

    LOG_INFO("[ScopeSession] Mode switch while scoped: '{}' -> '{}'", m_activeOptic->Name(), optic.Name());

    m_activeOptic = &optic;
    m_lastLoggedFov = 0.0f;
    m_stabilizer.Reset();

    // Snapshot from the first apply is kept; only the scaling is recomputed
    ApplyRenderParameters();
}

void ScopeSession::OnOpticExit() {
    if (!m_activeOptic) return;

    LOG_INFO("[ScopeSession] Optic exit");
    m_applier.Restore();
    m_stabilizer.Reset();
    m_scrollZoom.Reset();
    m_activeOptic = nullptr;
    m_lastResolution = {};
    m_lastLoggedFov = 0.0f;
}

// ============================================================================
// FOV
// ============================================================================

FovResolution ScopeSession::ResolveScopeFov() {
    if (!m_activeOptic) {
        m_lastResolution = {};
        return m_lastResolution;
    }

    FovResolution native = m_resolver.Resolve(m_activeOptic);
    m_scrollZoom.ObserveNativeFov(native.rawFov);
    if (native.Resolved() && !m_scrollZoom.RangeDiscovered()) {
        m_scrollZoom.DiscoverRange(*m_activeOptic);
    }

    const float overrideFov = m_scrollZoom.EffectiveScopeFov();
    if (overrideFov > optic_config::kMinConfidentFov) {
        m_lastResolution = {overrideFov, FovSource::ScrollOverride};
    } else {
        m_lastResolution = native;
    }
    return m_lastResolution;
}

float ScopeSession::ComputeZoomedFov(float baseFov) {
    if (m_config.zoom.autoFovFromScope) {
        const FovResolution res = ResolveScopeFov();
        if (res.Resolved()) {
            const float magnification = Magnification_FromFov(res.rawFov);
            const float resultFov = Magnification_CorrectedFov(baseFov, magnification);

            // Only log when the value actually changes
            if (std::abs(res.rawFov - m_lastLoggedFov) > optic_config::kFovLogEpsilon) {
                m_lastLoggedFov = res.rawFov;
                LOG_INFO("[ScopeSession] scopeFov={:.2f} -> mag={:.2f}x -> mainFov={:.1f} (baseFov={:.0f}) [{}]",
                         res.rawFov, magnification, resultFov, baseFov, FovSource_Name(res.source));
            }
            return resultFov;
        }
    }

    m_lastResolution.source = FovSource::Manual;
    return m_config.zoom.scopedFov;
}

float ScopeSession::CurrentMagnification() {
    const FovResolution res = ResolveScopeFov();
    if (res.Resolved()) return Magnification_FromFov(res.rawFov);
    return m_config.zoom.defaultZoom;
}

bool ScopeSession::OnScroll(float scrollDelta) {
    if (!m_activeOptic) return false;

    // Make sure the native FOV and range are current before scaling from them
    ResolveScopeFov();
    if (!m_scrollZoom.HandleScroll(scrollDelta, m_config.zoom)) return false;

    ApplyRenderParameters();
    return true;
}

// ============================================================================
// Render parameters / stabilization
// ============================================================================

void ScopeSession::ApplyRenderParameters() {
    const FovResolution res = ResolveScopeFov();

    // Unresolved optics keep unscaled LOD and draw distances
    const float magnification = res.Resolved() ? Magnification_FromFov(res.rawFov) : 1.0f;
    const std::optional<float> farClip = m_resolver.ProviderFarClip(m_activeOptic);

    m_applier.Apply(magnification, farClip);
}

void ScopeSession::LateUpdate(const Pose& camera, const Pose& lens, const Pose& optic, float unscaledDeltaTime) {
    if (!m_activeOptic || !m_config.stabilization.enabled) {
        if (m_stabilizer.IsInitialized()) m_stabilizer.Reset();
        return;
    }
    m_stabilizer.Update(camera, lens, optic, unscaledDeltaTime);
}

ScopeDiagnostics ScopeSession::Diagnostics() const {
    ScopeDiagnostics d;
    if (m_activeOptic) {
        try {
            d.activeOptic = std::string(m_activeOptic->Name());
        } catch (const std::exception& ex) {
            LOG_DEBUG("[ScopeSession] Optic name unavailable: {}", ex.what());
        }
    }
    d.scopeFov = m_lastResolution.rawFov;
    d.source = m_lastResolution.source;
    d.magnification = m_lastResolution.Resolved() ? Magnification_FromFov(m_lastResolution.rawFov) : 1.0f;
    d.discovery = m_registry.Method();
    d.renderApplied = m_applier.IsApplied();
    d.stabilizerInitialized = m_stabilizer.IsInitialized();
    d.lensDelta = m_stabilizer.LensDeltaCam();
    return d;
}
